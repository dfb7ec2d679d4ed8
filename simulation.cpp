#include "simulation.h"
#include "lineage.h"
#include "commandline.h"
#include <QString>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QScopedPointer>
#include <qnumeric.h>
#include "math.h"
#include <climits>

/////////////////////////////////////////////////////
//Simulation class - range reconstruction engine.
//movement() is one step of the movement function, propagate() runs it along a branch,
//combine() is the speciation function, and reconstruct() walks a tree tip-to-root
//applying both. run() drives a full command line session.
/////////////////////////////////////////////////////


/////////////////////////////////////////////////////
//Constructor/Destructor
/////////////////////////////////////////////////////

Simulation::Simulation()
{
    cl=nullptr;
}

Simulation::~Simulation()
{
    //destructor - do nothing
}


/////////////////////////////////////////////////////
//Movement function
/////////////////////////////////////////////////////

Grid Simulation::movement(const Grid &p, const Grid &environment, double alpha, double beta, SimulationError *error)
{
    //One synchronous step: every cell of the new grid is computed from the old grid only.
    //P'(i,q) = E(i,q) * ( (1-P)*(N/8)*alpha + P*(N/8)*beta ), N = neighbourhood sum around (i,q).
    //The divisor stays 8 at edges and corners - off-grid neighbours contribute nothing
    if (!p.sameshape(environment))
    {
        if (error) error->set(SimulationError::DimensionMismatch,QString("Grid is %1 but environment is %2").arg(p.shapestring()).arg(environment.shapestring()));
        return Grid();
    }

    Grid next(p.rows(),p.cols());
    for (int i=0; i<p.rows(); i++)
        for (int q=0; q<p.cols(); q++)
        {
            double nbar=p.neighbourhood(i,q)/NEIGHBOURHOOD_DIVISOR;
            double here=p.at(i,q);
            next.set(i,q,environment.at(i,q)*((1.0-here)*nbar*alpha+here*nbar*beta));
        }
    return next;
}

Grid Simulation::propagate(const Grid &p, const Grid &environment, double alpha, double beta, int steps, SimulationError *error)
{
    //integrate movement along one branch - each step's output is the next step's input
    if (steps<0)
    {
        if (error) error->set(SimulationError::NegativeStepCount,QString("Cannot propagate for %1 steps").arg(steps));
        return Grid();
    }
    if (!p.sameshape(environment))
    {
        if (error) error->set(SimulationError::DimensionMismatch,QString("Grid is %1 but environment is %2").arg(p.shapestring()).arg(environment.shapestring()));
        return Grid();
    }

    Grid current=p;
    for (int s=0; s<steps; s++)
        current=movement(current,environment,alpha,beta);
    return current;
}


/////////////////////////////////////////////////////
//Speciation function
/////////////////////////////////////////////////////

Grid Simulation::combine(const Grid &a, const Grid &b, SimulationError *error)
{
    //normalise each daughter grid by its own maximum, then multiply cell by cell
    if (!a.sameshape(b))
    {
        if (error) error->set(SimulationError::DimensionMismatch,QString("Daughter grids are %1 and %2").arg(a.shapestring()).arg(b.shapestring()));
        return Grid();
    }

    //max() can't see NaN cells, so check every cell first
    if (!a.allfinite())
    {
        if (error) error->set(SimulationError::DegenerateNormalization,"First grid has non-finite cells and cannot be normalised");
        return Grid();
    }
    if (!b.allfinite())
    {
        if (error) error->set(SimulationError::DegenerateNormalization,"Second grid has non-finite cells and cannot be normalised");
        return Grid();
    }

    double maxa=a.max();
    double maxb=b.max();
    if (!(maxa>0.0) || !qIsFinite(maxa))
    {
        if (error) error->set(SimulationError::DegenerateNormalization,QString("First grid has maximum %1 and cannot be normalised").arg(maxa));
        return Grid();
    }
    if (!(maxb>0.0) || !qIsFinite(maxb))
    {
        if (error) error->set(SimulationError::DegenerateNormalization,QString("Second grid has maximum %1 and cannot be normalised").arg(maxb));
        return Grid();
    }

    return a.normalised().multiplied(b.normalised());
}


/////////////////////////////////////////////////////
//Parameter helpers
/////////////////////////////////////////////////////

StepRule Simulation::stepsizerule(double stepsize)
{
    //branch length / step size, rounded to nearest. Negative, non-finite or huge counts
    //are left for validation to reject
    return [stepsize](double length) -> double
    {
        return floor(length/stepsize+0.5);
    };
}

bool Simulation::parametersinrange(double alpha, double beta)
{
    return alpha>=0.0 && alpha<=1.0 && beta>=0.0 && beta<=1.0;
}

void Simulation::setbranchenvironment(const QString &nodeidentifier, const Grid &environment)
{
    //environment used along the branch above the named node instead of the run environment
    branchenvironments.insert(nodeidentifier,environment);
}

void Simulation::clearbranchenvironments()
{
    branchenvironments.clear();
}

int Simulation::branchsteps(const QString &nodeidentifier) const
{
    return steps.value(nodeidentifier,-1);
}

const Grid &Simulation::environmentfor(Lineage *l, const Grid &environment) const
{
    QHash<QString,Grid>::const_iterator it=branchenvironments.constFind(l->identifier());
    if (it!=branchenvironments.constEnd()) return it.value();
    return environment;
}


/////////////////////////////////////////////////////
//Tree reconstruction
/////////////////////////////////////////////////////

bool Simulation::validate(Lineage *root, const QHash<QString,Grid> &tips, const Grid &environment, StepRule rule)
{
    //everything that can be wrong with the inputs is found here, before any propagation runs
    if (!Lineage::checktopology(root,&error)) return false;

    if (environment.isEmpty())
    {
        error.set(SimulationError::DimensionMismatch,"Environment grid is empty");
        return false;
    }

    QList<Lineage *> leaves;
    root->getleaflist(&leaves);
    foreach (Lineage *l, leaves)
    {
        QHash<QString,Grid>::const_iterator it=tips.constFind(l->label);
        if (it==tips.constEnd())
        {
            error.set(SimulationError::InvalidTopology,"Leaf has no species range grid",l->label);
            return false;
        }
        if (!it.value().sameshape(environment))
        {
            error.set(SimulationError::DimensionMismatch,QString("Range grid is %1 but environment is %2").arg(it.value().shapestring()).arg(environment.shapestring()),l->label);
            return false;
        }
    }

    QHashIterator<QString,Grid> bi(branchenvironments);
    while (bi.hasNext())
    {
        bi.next();
        if (!root->find(bi.key()))
        {
            error.set(SimulationError::InvalidTopology,"Branch environment given for a node that is not in the tree",bi.key());
            return false;
        }
        if (!bi.value().sameshape(environment))
        {
            error.set(SimulationError::DimensionMismatch,QString("Branch environment is %1 but environment is %2").arg(bi.value().shapestring()).arg(environment.shapestring()),bi.key());
            return false;
        }
    }

    //step counts for every branch below the root
    QList<Lineage *> internal;
    root->getinternallist(&internal);
    foreach (Lineage *parent, internal)
    {
        Lineage *daughters[2]={parent->daughter_lineage_A,parent->daughter_lineage_B};
        for (int d=0; d<2; d++)
        {
            double length=daughters[d]->branch_length;
            if (length<0.0)
            {
                error.set(SimulationError::NegativeStepCount,QString("Branch length %1 is negative").arg(length),daughters[d]->identifier());
                return false;
            }
            double n=rule(length);
            if (n<0.0)
            {
                error.set(SimulationError::NegativeStepCount,QString("Branch length %1 gives %2 steps").arg(length).arg(n),daughters[d]->identifier());
                return false;
            }
            if (!(n<=(double)INT_MAX))
            {
                error.set(SimulationError::OutOfRangeParameter,QString("Branch length %1 gives %2 steps, more than the limit of %3").arg(length).arg(n).arg(INT_MAX),daughters[d]->identifier());
                return false;
            }
            steps.insert(daughters[d]->identifier(),(int)n);
        }
    }
    return true;
}

QMap<QString,Grid> Simulation::reconstruct(Lineage *root, const QHash<QString,Grid> &tips, const Grid &environment,
                                           double alpha, double beta, StepRule rule, bool *ok)
{
    QMap<QString,Grid> results;
    error.clear();
    steps.clear();
    if (ok) *ok=false;

    if (!validate(root,tips,environment,rule)) return results;

    if (!parametersinrange(alpha,beta))
        qWarning()<<"alpha"<<alpha<<"and beta"<<beta<<"should both lie in [0,1] - continuing anyway";

    //node states for this run. Leaves are resolved from the start
    QHash<Lineage *,Grid> states;
    QList<Lineage *> leaves;
    root->getleaflist(&leaves);
    foreach (Lineage *l, leaves) states.insert(l,tips.value(l->label));

    //post-order: both daughters are resolved before their parent is reached
    QList<Lineage *> internal;
    root->getinternallist(&internal);
    foreach (Lineage *parent, internal)
    {
        Lineage *a=parent->daughter_lineage_A;
        Lineage *b=parent->daughter_lineage_B;
        int stepsa=steps.value(a->identifier());
        int stepsb=steps.value(b->identifier());

        Grid ga=propagate(states.value(a),environmentfor(a,environment),alpha,beta,stepsa,&error);
        if (error.isError()) {error.node=a->identifier(); return QMap<QString,Grid>();}
        Grid gb=propagate(states.value(b),environmentfor(b,environment),alpha,beta,stepsb,&error);
        if (error.isError()) {error.node=b->identifier(); return QMap<QString,Grid>();}

        Grid g=combine(ga,gb,&error);
        if (error.isError())
        {
            if (error.kind==SimulationError::DegenerateNormalization)
            {
                double maxa=ga.max();
                bool agood=ga.allfinite() && qIsFinite(maxa) && maxa>0.0;
                Lineage *bad=agood?b:a;
                const Grid &badgrid=agood?gb:ga;
                QString what=badgrid.allfinite()?"is all zero":"has non-finite cells";
                error.message=QString("Grid from daughter '%1' %2 after %3 steps and cannot be normalised")
                        .arg(bad->identifier()).arg(what).arg(bad==a?stepsa:stepsb);
            }
            error.node=parent->identifier();
            return QMap<QString,Grid>();
        }

        qDebug()<<"Resolved"<<parent->identifier()<<"from"<<a->identifier()<<"("<<stepsa<<"steps) and"<<b->identifier()<<"("<<stepsb<<"steps)";

        //daughter states are no longer needed once the parent is resolved
        states.remove(a);
        states.remove(b);
        states.insert(parent,g);
        results.insert(parent->identifier(),g);
    }

    if (ok) *ok=true;
    return results;
}


/////////////////////////////////////////////////////
//Command line run
/////////////////////////////////////////////////////

bool Simulation::loadtips(Lineage *root, QHash<QString,Grid> *tips)
{
    //explicit label=file pairs win over files found in the tip folder
    QList<Lineage *> leaves;
    root->getleaflist(&leaves);
    QMap<QString,QString> tipfiles=cl->gettipfiles();
    QString folder=cl->gettipfolder();

    foreach (Lineage *l, leaves)
    {
        QString fname;
        if (tipfiles.contains(l->label)) fname=tipfiles.value(l->label);
        else if (!folder.isEmpty())
        {
            QString candidate=QDir(folder).filePath(l->label+".csv");
            if (QFileInfo::exists(candidate)) fname=candidate;
        }
        if (fname.isEmpty()) continue; //reported by validation as a missing tip

        SimulationError e;
        Grid g=Grid::readfile(fname,&e);
        if (e.isError())
        {
            e.node=l->label;
            cl->logtext("Error: "+e.toString());
            return false;
        }
        tips->insert(l->label,g);
        cl->logtext(QString("Tip %1: %2 (%3 occupied cells)").arg(l->label).arg(fname).arg(g.count()-g.values().count(0.0)),OUTPUT_VERBOSE);
    }

    //tips named on the command line must exist in the tree
    QMapIterator<QString,QString> ti(tipfiles);
    while (ti.hasNext())
    {
        ti.next();
        bool found=false;
        foreach (Lineage *l, leaves) if (l->label==ti.key()) found=true;
        if (!found) cl->logtext(QString("Warning: tip '%1' is not a leaf of the tree - ignored").arg(ti.key()));
    }
    return true;
}

bool Simulation::loadbranchenvironments()
{
    clearbranchenvironments();
    QMapIterator<QString,QString> bi(cl->getbranchenvironmentfiles());
    while (bi.hasNext())
    {
        bi.next();
        SimulationError e;
        Grid g=Grid::readfile(bi.value(),&e);
        if (e.isError())
        {
            e.node=bi.key();
            cl->logtext("Error: "+e.toString());
            return false;
        }
        setbranchenvironment(bi.key(),g);
        cl->logtext(QString("Branch environment for %1: %2").arg(bi.key()).arg(bi.value()),OUTPUT_VERBOSE);
    }
    return true;
}

bool Simulation::run(CommandLine *commandline)
{
    //performs a reconstruction run for every alpha/beta pair requested
    //keep pointer to command line instance
    cl=commandline;

    cl->logtext("Starting reconstruction...");

    SimulationError e;
    QScopedPointer<Lineage> root(Lineage::readfile(cl->gettreefile(),&e));
    if (root.isNull())
    {
        cl->logtext("Error: "+e.toString());
        return false;
    }
    cl->logtext(QString("Tree %1: %2 leaves, %3 internal nodes").arg(cl->gettreefile()).arg(root->count_leaves()).arg(root->count_internal()),OUTPUT_VERBOSE);

    QHash<QString,Grid> tips;
    if (!loadtips(root.data(),&tips)) return false;

    Grid environment;
    if (!cl->getenvironmentfile().isEmpty())
    {
        environment=Grid::readfile(cl->getenvironmentfile(),&e);
        if (e.isError())
        {
            cl->logtext("Error: "+e.toString());
            return false;
        }
    }
    else
    {
        //no environment given - fully hospitable everywhere, sized as the tips
        if (tips.isEmpty())
        {
            cl->logtext("Error: no tip grids were loaded, so the grid size is unknown");
            return false;
        }
        const Grid &first=tips.constBegin().value();
        environment=Grid(first.rows(),first.cols(),1.0);
        cl->logtext(QString("No environment file - using uniform %1 environment").arg(environment.shapestring()),OUTPUT_VERBOSE);
    }

    if (!loadbranchenvironments()) return false;

    if (!cl->do_tree(root.data())) return false;

    StepRule rule=stepsizerule(cl->getstepsize());
    QList<double> alphas=cl->getalphas();
    QList<double> betas=cl->getbetas();
    int runcount=alphas.count()*betas.count();
    int runnumber=0;

    foreach (double alpha, alphas)
        foreach (double beta, betas)
        {
            runnumber++;
            if (!parametersinrange(alpha,beta))
                cl->logtext(QString("Warning: alpha %1, beta %2 outside [0,1]").arg(alpha).arg(beta));

            bool ok;
            QMap<QString,Grid> grids=reconstruct(root.data(),tips,environment,alpha,beta,rule,&ok);
            if (!ok)
            {
                cl->logtext(QString("%1: Error: %2").arg(runnumber).arg(error.toString()));
                return false;
            }

            if (!cl->do_grids(grids,alpha,beta,root.data())) return false;
            cl->logtext(QString("%1/%2: alpha %3, beta %4 - %5 node grids written").arg(runnumber).arg(runcount).arg(alpha).arg(beta).arg(grids.count()),OUTPUT_VERBOSE);
        }

    cl->logtext("...Done!");
    return true;
}
