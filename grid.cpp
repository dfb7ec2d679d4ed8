#include "grid.h"
#include "simulationerror.h"
#include <QFile>
#include <QTextStream>
#include <QStringList>
#include <QRegularExpression>
#include <QtGlobal>
#include <qnumeric.h>

/////////////////////////////////////////////////////
//Constructors
/////////////////////////////////////////////////////

Grid::Grid()
{
    nrows=0;
    ncols=0;
}

Grid::Grid(int rowcount, int colcount, double fillvalue)
{
    if (rowcount<=0 || colcount<=0) //degenerate request - make an empty grid
    {
        nrows=0;
        ncols=0;
        return;
    }
    nrows=rowcount;
    ncols=colcount;
    cells.fill(fillvalue,nrows*ncols);
}

bool Grid::sameshape(const Grid &other) const
{
    return nrows==other.nrows && ncols==other.ncols;
}

QString Grid::shapestring() const
{
    return QString("%1x%2").arg(nrows).arg(ncols);
}

void Grid::fill(double value)
{
    cells.fill(value);
}

/////////////////////////////////////////////////////
//Cell summaries
/////////////////////////////////////////////////////

double Grid::neighbourhood(int i, int q) const
{
    //sum of the 3x3 block around (i,q), clamped to the grid, minus the centre
    //interior cells see 8 neighbours, edges 5, corners 3
    int top=qMax(0,i-1);
    int bottom=qMin(nrows-1,i+1);
    int left=qMax(0,q-1);
    int right=qMin(ncols-1,q+1);

    double total=0.0;
    for (int r=top; r<=bottom; r++)
    {
        const double *row=cells.constData()+r*ncols;
        for (int c=left; c<=right; c++)
            total+=row[c];
    }
    return total-at(i,q);
}

double Grid::max() const
{
    if (cells.isEmpty()) return 0.0;
    double m=cells.at(0);
    for (int k=1; k<cells.count(); k++)
        if (cells.at(k)>m) m=cells.at(k);
    return m;
}

double Grid::sum() const
{
    double total=0.0;
    for (int k=0; k<cells.count(); k++) total+=cells.at(k);
    return total;
}

bool Grid::allzero() const
{
    for (int k=0; k<cells.count(); k++)
        if (cells.at(k)!=0.0) return false;
    return true;
}

bool Grid::allfinite() const
{
    for (int k=0; k<cells.count(); k++)
        if (!qIsFinite(cells.at(k))) return false;
    return true;
}

/////////////////////////////////////////////////////
//Element-wise operations
/////////////////////////////////////////////////////

Grid Grid::normalised() const
{
    //divide every cell by the grid maximum. A grid without a positive maximum
    //has nothing to scale by and is returned as-is; callers that need to know check max() first
    double m=max();
    if (!(m>0.0) || !qIsFinite(m)) return *this;

    Grid g(*this);
    double *d=g.cells.data();
    for (int k=0; k<g.cells.count(); k++) d[k]/=m;
    return g;
}

Grid Grid::multiplied(const Grid &other) const
{
    //element-wise product. Shapes must match - checked by caller
    Grid g(*this);
    double *d=g.cells.data();
    const double *o=other.cells.constData();
    for (int k=0; k<g.cells.count(); k++) d[k]*=o[k];
    return g;
}

bool Grid::operator==(const Grid &other) const
{
    return sameshape(other) && cells==other.cells;
}

/////////////////////////////////////////////////////
//Text input/output - one row per line, one value per cell
/////////////////////////////////////////////////////

QString Grid::dump(QChar delimiter) const
{
    QString s;
    QTextStream out(&s);
    for (int i=0; i<nrows; i++)
    {
        for (int q=0; q<ncols; q++)
        {
            if (q>0) out<<delimiter;
            out<<QString::number(at(i,q),'g',17); //17 significant digits - lossless for doubles
        }
        out<<"\n";
    }
    out.flush();
    return s;
}

bool Grid::writefile(const QString &fname, QChar delimiter, SimulationError *error) const
{
    QFile f(fname);
    if (f.open(QIODevice::WriteOnly | QIODevice::Text)==false)
    {
        if (error) error->set(SimulationError::InvalidInput,QString("Couldn't open grid file '%1' for output: %2").arg(fname).arg(f.errorString()));
        return false;
    }
    QTextStream out(&f);
    out<<dump(delimiter);
    out.flush();
    f.close();
    return true;
}

Grid Grid::fromtext(const QString &text, SimulationError *error)
{
    //accepts comma, semicolon, tab or space separated rows. Blank lines are skipped
    static const QRegularExpression separators("[,;\\s]+");

    QStringList lines=text.split('\n');
    QVector<double> values;
    int colcount=-1;
    int rowcount=0;

    for (int l=0; l<lines.count(); l++)
    {
        QString line=lines.at(l).trimmed();
        if (line.isEmpty()) continue;

        QStringList fields=line.split(separators,QString::SkipEmptyParts);
        if (fields.isEmpty())
        {
            if (error) error->set(SimulationError::InvalidInput,QString("Line %1 has no values").arg(l+1));
            return Grid();
        }
        if (colcount==-1) colcount=fields.count();
        else if (fields.count()!=colcount)
        {
            if (error) error->set(SimulationError::InvalidInput,QString("Line %1 has %2 values, expected %3").arg(l+1).arg(fields.count()).arg(colcount));
            return Grid();
        }

        for (int c=0; c<fields.count(); c++)
        {
            bool ok;
            double v=fields.at(c).toDouble(&ok);
            if (!ok || !qIsFinite(v))
            {
                if (error) error->set(SimulationError::InvalidInput,QString("Line %1, column %2: '%3' is not a number").arg(l+1).arg(c+1).arg(fields.at(c)));
                return Grid();
            }
            if (v<0.0)
            {
                if (error) error->set(SimulationError::InvalidInput,QString("Line %1, column %2: negative value %3").arg(l+1).arg(c+1).arg(v));
                return Grid();
            }
            values.append(v);
        }
        rowcount++;
    }

    if (rowcount==0)
    {
        if (error) error->set(SimulationError::InvalidInput,"No grid values found");
        return Grid();
    }

    Grid g;
    g.nrows=rowcount;
    g.ncols=colcount;
    g.cells=values;
    return g;
}

Grid Grid::readfile(const QString &fname, SimulationError *error)
{
    QFile f(fname);
    if (f.open(QIODevice::ReadOnly | QIODevice::Text)==false)
    {
        if (error) error->set(SimulationError::InvalidInput,QString("Couldn't open grid file '%1': %2").arg(fname).arg(f.errorString()));
        return Grid();
    }
    QTextStream in(&f);
    QString text=in.readAll();
    f.close();

    SimulationError e;
    Grid g=fromtext(text,&e);
    if (e.isError())
    {
        e.message=QString("%1: %2").arg(fname).arg(e.message);
        if (error) *error=e;
        return Grid();
    }
    return g;
}
