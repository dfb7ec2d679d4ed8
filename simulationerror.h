#ifndef SIMULATIONERROR_H
#define SIMULATIONERROR_H

#include <QString>

//Error record filled in by grid, tree and engine operations that can fail.
//node is the identifier of the tree node (or branch, named by its lower node) involved, if any
struct SimulationError
{
    enum Kind
    {
        NoError,
        DimensionMismatch,
        InvalidTopology,
        DegenerateNormalization,
        NegativeStepCount,
        OutOfRangeParameter,
        InvalidInput
    };

    Kind kind;
    QString node;
    QString message;

    SimulationError() : kind(NoError) {}

    void set(Kind k, const QString &m, const QString &n=QString())
    {
        kind=k;
        message=m;
        node=n;
    }

    void clear()
    {
        kind=NoError;
        message.clear();
        node.clear();
    }

    bool isError() const { return kind!=NoError; }

    static QString kindToString(Kind k)
    {
        switch (k)
        {
            case NoError: return "No error";
            case DimensionMismatch: return "Dimension mismatch";
            case InvalidTopology: return "Invalid topology";
            case DegenerateNormalization: return "Degenerate normalization";
            case NegativeStepCount: return "Negative step count";
            case OutOfRangeParameter: return "Parameter out of range";
            case InvalidInput: return "Invalid input";
        }
        return "Unknown error";
    }

    QString toString() const
    {
        if (node.isEmpty()) return QString("%1: %2").arg(kindToString(kind)).arg(message);
        return QString("%1 at node '%2': %3").arg(kindToString(kind)).arg(node).arg(message);
    }
};

#endif // SIMULATIONERROR_H
