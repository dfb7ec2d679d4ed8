#include <QCoreApplication>
#include <QTextStream>
#include "commandline.h"
#include "simulation.h"

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);
    QCoreApplication::setApplicationName("phylorange");
    QCoreApplication::setApplicationVersion(VERSION);

    CommandLine cl;
    if (!cl.parse(a.arguments()))
    {
        QTextStream err(stderr);
        err<<"phylorange: "<<cl.errorString()<<"\n\n"<<cl.helptext();
        return 2;
    }
    if (cl.helprequested())
    {
        QTextStream(stdout)<<cl.helptext();
        return 0;
    }
    if (cl.versionrequested())
    {
        QTextStream(stdout)<<QString("phylorange v%1\n").arg(VERSION);
        return 0;
    }

    Simulation sim;
    return sim.run(&cl)?0:1;
}
