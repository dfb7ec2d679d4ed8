#ifndef COMMANDLINE_H
#define COMMANDLINE_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include <QChar>
#include "grid.h"
#include "simulation.h"

class Lineage;

class CommandLine
{
public:
    CommandLine();
    ~CommandLine();

    bool parse(const QStringList &arguments);
    QString errorString() const { return error; }
    QString helptext() const { return help; }
    bool helprequested() const { return wanthelp; }
    bool versionrequested() const { return wantversion; }

    void logtext(const QString &text, int level=OUTPUT_QUIET);
    void setlogstring(QString *s);

    //gets for run parameters / settings
    QString gettreefile();
    QString getenvironmentfile();
    QMap<QString,QString> gettipfiles();
    QString gettipfolder();
    QList<double> getalphas();
    QList<double> getbetas();
    double getstepsize();
    QMap<QString,QString> getbranchenvironmentfiles();
    QString getoutputpath();
    QString getstub();
    bool getnormalise();
    QChar getdelimiter();
    bool getverbose();

    //output files
    QString getgridfilename(const QString &node, double alpha, double beta);
    QString getsummaryfilename(double alpha, double beta);
    QString gettreefilename();
    bool do_grids(const QMap<QString,Grid> &grids, double alpha, double beta, Lineage *root);
    bool do_tree(Lineage *root);
    QString summarytable(const QMap<QString,Grid> &grids, Lineage *root);

private:
    QString treefile;
    QString environmentfile;
    QMap<QString,QString> tipfiles;
    QString tipfolder;
    QList<double> alphas;
    QList<double> betas;
    double stepsize;
    QMap<QString,QString> branchenvironmentfiles;
    QString outputpath;
    QString stub;
    bool normalise;
    QChar delimiter;
    bool verbose;

    QString error;
    QString help;
    bool wanthelp;
    bool wantversion;
    QString *logstring;

    bool parselist(const QString &text, const QString &name, QList<double> *list);
    bool parsepairs(const QStringList &pairs, const QString &name, QMap<QString,QString> *map);
    bool parsedelimiter(const QString &text);
    QString filesafe(const QString &name);
    QString parameterstring(double alpha, double beta);
};

#endif // COMMANDLINE_H
