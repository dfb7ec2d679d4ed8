#ifndef GRID_H
#define GRID_H

#include <QVector>
#include <QString>
#include <QChar>

struct SimulationError;

/////////////////////////////////////////////////////////////////////
//Grid class - rectangular occupancy/intensity or environment matrix.
//Cells are stored row-major. Values are plain doubles; the class does
//not enforce non-negativity except when reading from text.
//Copies are cheap (QVector is implicitly shared) until one side is written.
/////////////////////////////////////////////////////////////////////

class Grid
{
public:
    Grid();
    Grid(int rowcount, int colcount, double fillvalue=0.0);

    int rows() const { return nrows; }
    int cols() const { return ncols; }
    int count() const { return cells.count(); }
    bool isEmpty() const { return cells.isEmpty(); }
    bool sameshape(const Grid &other) const;
    QString shapestring() const;

    double at(int i, int q) const { return cells.at(i*ncols+q); }
    void set(int i, int q, double value) { cells[i*ncols+q]=value; }
    void fill(double value);
    const QVector<double> &values() const { return cells; }

    double neighbourhood(int i, int q) const;
    double max() const;
    double sum() const;
    bool allzero() const;
    bool allfinite() const;

    Grid normalised() const;
    Grid multiplied(const Grid &other) const;

    bool operator==(const Grid &other) const;
    bool operator!=(const Grid &other) const { return !(*this==other); }

    QString dump(QChar delimiter=QChar(',')) const;
    bool writefile(const QString &fname, QChar delimiter=QChar(','), SimulationError *error=nullptr) const;
    static Grid fromtext(const QString &text, SimulationError *error=nullptr);
    static Grid readfile(const QString &fname, SimulationError *error=nullptr);

private:
    int nrows;
    int ncols;
    QVector<double> cells;
};

#endif // GRID_H
