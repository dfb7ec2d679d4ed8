#ifndef LINEAGE_H
#define LINEAGE_H

#include <QString>
#include <QList>
#include <QSet>

struct SimulationError;

//deepest parenthesis nesting the Newick reader accepts. Reading, writing and
//deleting a tree recurse once per level, so this bounds their stack use
#define NEWICK_MAX_DEPTH 4096

/////////////////////////////////////////////////////////////////////
//Lineage class - one node of a rooted binary phylogeny. branch_length is
//the length of the edge joining this node to its parent (unused at the root).
//Leaves carry a label; internal nodes may, and are otherwise known as n<id>.
//A lineage owns its daughters and deletes them recursively.
/////////////////////////////////////////////////////////////////////

class Lineage
{
public:
    qint64 id;
    QString label;
    double branch_length;
    Lineage *daughter_lineage_A;
    Lineage *daughter_lineage_B;
    Lineage *parent_lineage;

    Lineage(Lineage *parent, qint64 nodeid, const QString &name=QString(), double length=0.0);
    ~Lineage();

    bool isleaf() const { return daughter_lineage_A==nullptr && daughter_lineage_B==nullptr; }
    int daughtercount() const;
    QString identifier() const;

    int count_leaves();
    int count_internal();
    void getleaflist(QList<Lineage *> *list);
    void getinternallist(QList<Lineage *> *list);
    bool isThisADescendent(Lineage *desc);
    Lineage *find(const QString &nodeidentifier);

    QString newickstring();
    static Lineage *fromnewick(const QString &text, SimulationError *error=nullptr);
    static Lineage *readfile(const QString &fname, SimulationError *error=nullptr);
    static bool checktopology(Lineage *root, SimulationError *error=nullptr);
};

#endif // LINEAGE_H
