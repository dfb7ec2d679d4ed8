#include "lineage.h"
#include "simulationerror.h"
#include <QTextStream>
#include <QFile>
#include <QHash>
#include <QDebug>

/////////////////////////////////////////////////////////////////////
//Lineage class - a node of the phylogeny used for range reconstruction.
//Daughters are A and B; a leaf has neither. Trees are built by the Newick
//reader (or by hand in tests) and are read-only during a reconstruction.
/////////////////////////////////////////////////////////////////////


/////////////////////////////////////////////////////
//Constructor/destructor
/////////////////////////////////////////////////////

Lineage::Lineage(Lineage *parent, qint64 nodeid, const QString &name, double length)
{
    id=nodeid;
    label=name;
    branch_length=length;
    daughter_lineage_A=nullptr;
    daughter_lineage_B=nullptr;
    parent_lineage=parent;
}

Lineage::~Lineage()
{
    //Recursively delete all daughter lineages via their destructors
    if (daughter_lineage_A!=nullptr) delete daughter_lineage_A;
    if (daughter_lineage_B!=nullptr) delete daughter_lineage_B;
}

int Lineage::daughtercount() const
{
    int c=0;
    if (daughter_lineage_A) c++;
    if (daughter_lineage_B) c++;
    return c;
}

QString Lineage::identifier() const
{
    //label if there is one, otherwise a generated name from the node id
    if (!label.isEmpty()) return label;
    return QString("n%1").arg(id);
}


/////////////////////////////////////////////////////
//Recursive functions to report on/summarise tree
/////////////////////////////////////////////////////

int Lineage::count_leaves()
{
    if (isleaf()) return 1;
    int c=0;
    if (daughter_lineage_A) c+=daughter_lineage_A->count_leaves();
    if (daughter_lineage_B) c+=daughter_lineage_B->count_leaves();
    return c;
}

int Lineage::count_internal()
{
    if (isleaf()) return 0;
    int c=1;
    if (daughter_lineage_A) c+=daughter_lineage_A->count_internal();
    if (daughter_lineage_B) c+=daughter_lineage_B->count_internal();
    return c;
}

void Lineage::getleaflist(QList<Lineage *> *list)
{
    //appends all descending leaves to the list (including this one), A before B.
    //Uses an explicit stack so tree depth isn't limited by the call stack
    QList<Lineage *> stack;
    stack.append(this);
    while (!stack.isEmpty())
    {
        Lineage *l=stack.takeLast();
        if (l->isleaf())
        {
            list->append(l);
            continue;
        }
        if (l->daughter_lineage_B) stack.append(l->daughter_lineage_B);
        if (l->daughter_lineage_A) stack.append(l->daughter_lineage_A);
    }
}

void Lineage::getinternallist(QList<Lineage *> *list)
{
    //appends internal nodes in post-order - both daughters' subtrees before the node itself.
    //Node, B, A visited with an explicit stack gives the reverse of A, B, node
    QList<Lineage *> reversed;
    QList<Lineage *> stack;
    stack.append(this);
    while (!stack.isEmpty())
    {
        Lineage *l=stack.takeLast();
        if (l->isleaf()) continue;
        reversed.append(l);
        if (l->daughter_lineage_A) stack.append(l->daughter_lineage_A);
        if (l->daughter_lineage_B) stack.append(l->daughter_lineage_B);
    }
    for (int i=reversed.count()-1; i>=0; i--) list->append(reversed.at(i));
}

bool Lineage::isThisADescendent(Lineage *desc)
{
    //recursive function - does the lineage passed appear in descendents of this lineage?
    if (this==desc) return true;
    if (daughter_lineage_A && daughter_lineage_A->isThisADescendent(desc)) return true;
    if (daughter_lineage_B && daughter_lineage_B->isThisADescendent(desc)) return true;
    return false;
}

Lineage *Lineage::find(const QString &nodeidentifier)
{
    if (identifier()==nodeidentifier) return this;
    Lineage *l=nullptr;
    if (daughter_lineage_A) l=daughter_lineage_A->find(nodeidentifier);
    if (!l && daughter_lineage_B) l=daughter_lineage_B->find(nodeidentifier);
    return l;
}

bool Lineage::checktopology(Lineage *root, SimulationError *error)
{
    //walks the structure without recursion so a malformed (cyclic) structure can't run away.
    //Every node must have 0 or 2 daughters, be reached once only, leaves must be labelled
    //and node identifiers must be unique
    if (!root)
    {
        if (error) error->set(SimulationError::InvalidTopology,"No tree supplied");
        return false;
    }

    QSet<Lineage *> visited;
    QHash<QString,Lineage *> identifiers;
    QList<Lineage *> stack;
    stack.append(root);

    while (!stack.isEmpty())
    {
        Lineage *l=stack.takeLast();
        if (visited.contains(l))
        {
            if (error) error->set(SimulationError::InvalidTopology,"Node reached twice - tree contains a cycle or shared subtree",l->identifier());
            return false;
        }
        visited.insert(l);

        int dc=l->daughtercount();
        if (dc!=0 && dc!=2)
        {
            if (error) error->set(SimulationError::InvalidTopology,QString("Node has %1 daughter(s), expected 0 or 2").arg(dc),l->identifier());
            return false;
        }
        if (dc==0 && l->label.isEmpty())
        {
            if (error) error->set(SimulationError::InvalidTopology,"Leaf has no label",l->identifier());
            return false;
        }

        QString ident=l->identifier();
        if (identifiers.contains(ident))
        {
            if (error) error->set(SimulationError::InvalidTopology,"Node identifier is used more than once",ident);
            return false;
        }
        identifiers.insert(ident,l);

        //push B first so A is processed first - keeps reports in reading order
        if (l->daughter_lineage_B) stack.append(l->daughter_lineage_B);
        if (l->daughter_lineage_A) stack.append(l->daughter_lineage_A);
    }
    return true;
}


/////////////////////////////////////////////////////
//Generate tree-file output recursively
/////////////////////////////////////////////////////

static QString newicklabel(const QString &label)
{
    //quote labels that contain Newick punctuation or whitespace
    bool needsquote=false;
    for (int i=0; i<label.length(); i++)
    {
        QChar c=label.at(i);
        if (c.isSpace() || QString("()[]',:;").contains(c)) {needsquote=true; break;}
    }
    if (!needsquote) return label;
    QString s=label;
    s.replace("'","''");
    return "'"+s+"'";
}

QString Lineage::newickstring()
{
    //recursively generate Newick-format text description of tree - internal nodes
    //carry their identifier so that output grids can be matched back to the tree
    QString s;
    QTextStream out(&s);
    if (!isleaf())
    {
        out<<"(";
        if (daughter_lineage_A) out<<daughter_lineage_A->newickstring();
        if (daughter_lineage_A && daughter_lineage_B) out<<",";
        if (daughter_lineage_B) out<<daughter_lineage_B->newickstring();
        out<<")";
    }
    out<<newicklabel(identifier());
    if (parent_lineage || branch_length!=0.0) out<<":"<<QString::number(branch_length,'g',12);
    out.flush();
    return s;
}


/////////////////////////////////////////////////////
//Newick reader - recursive descent over the tree text
/////////////////////////////////////////////////////

namespace
{

class NewickReader
{
public:
    NewickReader(const QString &t) : text(t), pos(0), nextid(0), depth(0) {}

    Lineage *parse(SimulationError *error)
    {
        Lineage *root=parsenode(nullptr,error);
        if (!root) return nullptr;
        skipspace();
        if (pos<text.length() && text.at(pos)==';')
        {
            pos++;
            skipspace();
        }
        if (pos<text.length())
        {
            fail(error,QString("Unexpected '%1' after end of tree").arg(text.at(pos)));
            delete root;
            return nullptr;
        }
        return root;
    }

private:
    QString text;
    int pos;
    qint64 nextid;
    int depth;

    void fail(SimulationError *error, const QString &message, SimulationError::Kind kind=SimulationError::InvalidInput, const QString &node=QString())
    {
        if (error) error->set(kind,QString("Newick position %1: %2").arg(pos+1).arg(message),node);
    }

    void skipspace()
    {
        //whitespace and [comments] are ignored between tokens
        while (pos<text.length())
        {
            QChar c=text.at(pos);
            if (c.isSpace()) {pos++; continue;}
            if (c=='[')
            {
                int close=text.indexOf(']',pos);
                if (close==-1) {pos=text.length(); return;}
                pos=close+1;
                continue;
            }
            return;
        }
    }

    bool readlabel(QString *label, SimulationError *error)
    {
        skipspace();
        if (pos>=text.length()) return true;
        if (text.at(pos)=='\'')
        {
            //quoted label, '' is an embedded quote
            pos++;
            while (true)
            {
                if (pos>=text.length())
                {
                    fail(error,"Unterminated quoted label");
                    return false;
                }
                QChar c=text.at(pos++);
                if (c=='\'')
                {
                    if (pos<text.length() && text.at(pos)=='\'') {label->append('\''); pos++; continue;}
                    return true;
                }
                label->append(c);
            }
        }
        static const QString stops="()[],:;'";
        while (pos<text.length())
        {
            QChar c=text.at(pos);
            if (c.isSpace() || stops.contains(c)) break;
            label->append(c);
            pos++;
        }
        return true;
    }

    bool readlength(double *length, SimulationError *error)
    {
        skipspace();
        if (pos>=text.length() || text.at(pos)!=':') return true;
        pos++;
        skipspace();
        int start=pos;
        while (pos<text.length())
        {
            QChar c=text.at(pos);
            if (c.isDigit() || c=='.' || c=='-' || c=='+' || c=='e' || c=='E') pos++;
            else break;
        }
        bool ok;
        double v=text.mid(start,pos-start).toDouble(&ok);
        if (!ok)
        {
            fail(error,QString("Bad branch length '%1'").arg(text.mid(start,pos-start)));
            return false;
        }
        *length=v;
        return true;
    }

    Lineage *parsenode(Lineage *parent, SimulationError *error)
    {
        skipspace();
        if (pos>=text.length())
        {
            fail(error,"Unexpected end of tree");
            return nullptr;
        }

        //ids are assigned in pre-order, as nodes are first met
        Lineage *l=new Lineage(parent,nextid++);

        if (text.at(pos)=='(')
        {
            if (depth>=NEWICK_MAX_DEPTH)
            {
                fail(error,QString("Tree is nested more than %1 levels deep").arg(NEWICK_MAX_DEPTH));
                delete l;
                return nullptr;
            }
            pos++;
            int daughters=0;
            while (true)
            {
                depth++;
                Lineage *d=parsenode(l,error);
                depth--;
                if (!d) {delete l; return nullptr;}
                if (daughters==0) l->daughter_lineage_A=d;
                else if (daughters==1) l->daughter_lineage_B=d;
                else
                {
                    delete d;
                    QString where=l->identifier();
                    fail(error,"Node has more than two daughters - polytomies are not supported",SimulationError::InvalidTopology,where);
                    delete l;
                    return nullptr;
                }
                daughters++;

                skipspace();
                if (pos>=text.length())
                {
                    fail(error,"Missing ')'");
                    delete l;
                    return nullptr;
                }
                QChar c=text.at(pos);
                if (c==',') {pos++; continue;}
                if (c==')') {pos++; break;}
                fail(error,QString("Expected ',' or ')' but found '%1'").arg(c));
                delete l;
                return nullptr;
            }
        }

        QString name;
        if (!readlabel(&name,error)) {delete l; return nullptr;}
        l->label=name;
        if (!readlength(&(l->branch_length),error)) {delete l; return nullptr;}
        return l;
    }
};

}

Lineage *Lineage::fromnewick(const QString &text, SimulationError *error)
{
    NewickReader reader(text);
    return reader.parse(error);
}

Lineage *Lineage::readfile(const QString &fname, SimulationError *error)
{
    QFile f(fname);
    if (f.open(QIODevice::ReadOnly | QIODevice::Text)==false)
    {
        if (error) error->set(SimulationError::InvalidInput,QString("Couldn't open tree file '%1': %2").arg(fname).arg(f.errorString()));
        return nullptr;
    }
    QTextStream in(&f);
    QString text=in.readAll();
    f.close();

    Lineage *root=fromnewick(text,error);
    if (!root) qDebug()<<"Tree file"<<fname<<"could not be read";
    return root;
}
