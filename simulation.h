#ifndef SIMULATION_H
#define SIMULATION_H

#include <QHash>
#include <QMap>
#include <QString>
#include <functional>
#include "grid.h"
#include "simulationerror.h"

#define OUTPUT_QUIET 0
#define OUTPUT_VERBOSE 1

//Constant divisor of the neighbourhood sum in the movement function. Applied at
//every cell, including edges and corners where fewer than 8 neighbours exist
#define NEIGHBOURHOOD_DIVISOR 8.0

class Lineage;
class CommandLine;

//maps a branch length to the number of movement steps applied along that branch.
//The count is returned as a double so that validation can reject counts an int can't hold
typedef std::function<double(double)> StepRule;

class Simulation
{
public:
    Simulation();
    ~Simulation();

    bool run(CommandLine *commandline);

    //movement and speciation functions
    static Grid movement(const Grid &p, const Grid &environment, double alpha, double beta, SimulationError *error=nullptr);
    static Grid propagate(const Grid &p, const Grid &environment, double alpha, double beta, int steps, SimulationError *error=nullptr);
    static Grid combine(const Grid &a, const Grid &b, SimulationError *error=nullptr);

    static StepRule stepsizerule(double stepsize);
    static bool parametersinrange(double alpha, double beta);

    //whole-tree reconstruction. Returns grids for every internal node keyed by identifier
    QMap<QString,Grid> reconstruct(Lineage *root, const QHash<QString,Grid> &tips, const Grid &environment,
                                   double alpha, double beta, StepRule rule, bool *ok=nullptr);

    void setbranchenvironment(const QString &nodeidentifier, const Grid &environment);
    void clearbranchenvironments();
    int branchsteps(const QString &nodeidentifier) const;
    SimulationError lastError() const { return error; }

private:
    CommandLine *cl;
    SimulationError error;
    QHash<QString,Grid> branchenvironments;
    QHash<QString,int> steps; //per run - steps along the branch above each node

    bool validate(Lineage *root, const QHash<QString,Grid> &tips, const Grid &environment, StepRule rule);
    const Grid &environmentfor(Lineage *l, const Grid &environment) const;
    bool loadtips(Lineage *root, QHash<QString,Grid> *tips);
    bool loadbranchenvironments();
};

#endif // SIMULATION_H
