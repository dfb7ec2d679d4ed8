#include "commandline.h"
#include "lineage.h"
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QSettings>
#include <QFileInfo>
#include <QDir>
#include <QFile>
#include <QTextStream>
#include <QVariant>
#include <qnumeric.h>


/////////////////////////////////////////////////////
//CommandLine object - handle options, config file, logging and output files
/////////////////////////////////////////////////////


/////////////////////////////////////////////////////
//Constructor/destructor
/////////////////////////////////////////////////////

CommandLine::CommandLine()
{
    //defaults - a single run at alpha=beta=0.5, one step per unit of branch length
    alphas.append(0.5);
    betas.append(0.5);
    stepsize=1.0;
    outputpath=".";
    stub="phylorange";
    normalise=false;
    delimiter=',';
    verbose=false;
    wanthelp=false;
    wantversion=false;
    logstring=nullptr;
}

CommandLine::~CommandLine()
{
}


/////////////////////////////////////////////////////
//Option parsing
/////////////////////////////////////////////////////

static QString settingtext(QSettings &settings, const QString &key)
{
    //unquoted comma separated INI values come back as string lists
    QVariant v=settings.value(key);
    if (v.type()==QVariant::StringList) return v.toStringList().join(",");
    return v.toString();
}

static QString relativeto(const QDir &dir, const QString &fname)
{
    if (fname.isEmpty() || QFileInfo(fname).isAbsolute()) return fname;
    return dir.filePath(fname);
}

bool CommandLine::parselist(const QString &text, const QString &name, QList<double> *list)
{
    QList<double> values;
    QStringList parts=text.split(',',QString::SkipEmptyParts);
    foreach (QString part, parts)
    {
        bool ok;
        double v=part.trimmed().toDouble(&ok);
        if (!ok)
        {
            error=QString("Bad %1 value '%2'").arg(name).arg(part.trimmed());
            return false;
        }
        values.append(v);
    }
    if (values.isEmpty())
    {
        error=QString("No %1 values given").arg(name);
        return false;
    }
    *list=values;
    return true;
}

bool CommandLine::parsepairs(const QStringList &pairs, const QString &name, QMap<QString,QString> *map)
{
    //LABEL=FILE pairs. The label is everything before the last '=' so file names can't contain one
    foreach (QString pair, pairs)
    {
        int split=pair.lastIndexOf('=');
        if (split<=0 || split==pair.length()-1)
        {
            error=QString("Bad %1 '%2' - expected LABEL=FILE").arg(name).arg(pair);
            return false;
        }
        map->insert(pair.left(split),pair.mid(split+1));
    }
    return true;
}

bool CommandLine::parsedelimiter(const QString &text)
{
    if (text=="tab" || text=="\\t") {delimiter='\t'; return true;}
    if (text=="space") {delimiter=' '; return true;}
    if (text.length()==1) {delimiter=text.at(0); return true;}
    error=QString("Bad delimiter '%1' - use a single character, 'tab' or 'space'").arg(text);
    return false;
}

bool CommandLine::parse(const QStringList &arguments)
{
    error.clear();

    QCommandLineParser parser;
    parser.setApplicationDescription("Reconstructs ancestral range grids along a binary phylogeny");
    QCommandLineOption helpoption=parser.addHelpOption();
    QCommandLineOption versionoption=parser.addVersionOption();

    QCommandLineOption configoption("config","INI file with a [run] group of default settings.","file");
    QCommandLineOption treeoption("tree","Newick tree file.","file");
    QCommandLineOption environmentoption("environment","Environment grid. Defaults to all ones.","file");
    QCommandLineOption tipoption("tip","Species range grid for one leaf (repeatable).","label=file");
    QCommandLineOption tipfolderoption("tip-folder","Folder of species range grids named <label>.csv.","dir");
    QCommandLineOption alphaoption("alpha","Comma separated alpha values.","list");
    QCommandLineOption betaoption("beta","Comma separated beta values.","list");
    QCommandLineOption stepsizeoption("step-size","Branch length per movement step.","x");
    QCommandLineOption branchenvoption("branch-environment","Environment for the branch above one node (repeatable).","node=file");
    QCommandLineOption outputoption("output","Output folder.","dir");
    QCommandLineOption stuboption("stub","Output file name stub.","name");
    QCommandLineOption normaliseoption("normalise","Write node grids normalised to a maximum of 1.");
    QCommandLineOption delimiteroption("delimiter","Output delimiter: a character, 'tab' or 'space'.","c");
    QCommandLineOption verboseoption("verbose","Verbose log output.");

    parser.addOption(configoption);
    parser.addOption(treeoption);
    parser.addOption(environmentoption);
    parser.addOption(tipoption);
    parser.addOption(tipfolderoption);
    parser.addOption(alphaoption);
    parser.addOption(betaoption);
    parser.addOption(stepsizeoption);
    parser.addOption(branchenvoption);
    parser.addOption(outputoption);
    parser.addOption(stuboption);
    parser.addOption(normaliseoption);
    parser.addOption(delimiteroption);
    parser.addOption(verboseoption);

    help=parser.helpText();
    if (!parser.parse(arguments))
    {
        error=parser.errorText();
        return false;
    }
    if (parser.isSet(helpoption)) {wanthelp=true; return true;}
    if (parser.isSet(versionoption)) {wantversion=true; return true;}

    //1. config file, if any, provides defaults. Relative paths are taken from the config file's folder
    if (parser.isSet(configoption))
    {
        QString configfile=parser.value(configoption);
        if (!QFileInfo::exists(configfile))
        {
            error=QString("Config file '%1' not found").arg(configfile);
            return false;
        }
        QDir base=QFileInfo(configfile).absoluteDir();
        QSettings settings(configfile,QSettings::IniFormat);
        if (settings.status()!=QSettings::NoError)
        {
            error=QString("Config file '%1' could not be read").arg(configfile);
            return false;
        }

        settings.beginGroup("run");
        if (settings.contains("tree")) treefile=relativeto(base,settingtext(settings,"tree"));
        if (settings.contains("environment")) environmentfile=relativeto(base,settingtext(settings,"environment"));
        if (settings.contains("tip-folder")) tipfolder=relativeto(base,settingtext(settings,"tip-folder"));
        if (settings.contains("alpha") && !parselist(settingtext(settings,"alpha"),"alpha",&alphas)) return false;
        if (settings.contains("beta") && !parselist(settingtext(settings,"beta"),"beta",&betas)) return false;
        if (settings.contains("step-size"))
        {
            bool ok;
            stepsize=settingtext(settings,"step-size").toDouble(&ok);
            if (!ok)
            {
                error=QString("Bad step-size '%1' in config file").arg(settingtext(settings,"step-size"));
                return false;
            }
        }
        if (settings.contains("output")) outputpath=relativeto(base,settingtext(settings,"output"));
        if (settings.contains("stub")) stub=settingtext(settings,"stub");
        if (settings.contains("normalise")) normalise=settings.value("normalise").toBool();
        if (settings.contains("delimiter") && !parsedelimiter(settingtext(settings,"delimiter"))) return false;
        if (settings.contains("verbose")) verbose=settings.value("verbose").toBool();
        settings.endGroup();

        settings.beginGroup("tips");
        foreach (QString key, settings.childKeys())
            tipfiles.insert(key,relativeto(base,settingtext(settings,key)));
        settings.endGroup();

        settings.beginGroup("branch-environments");
        foreach (QString key, settings.childKeys())
            branchenvironmentfiles.insert(key,relativeto(base,settingtext(settings,key)));
        settings.endGroup();
    }

    //2. explicit options win over the config file
    if (parser.isSet(treeoption)) treefile=parser.value(treeoption);
    if (parser.isSet(environmentoption)) environmentfile=parser.value(environmentoption);
    if (parser.isSet(tipfolderoption)) tipfolder=parser.value(tipfolderoption);
    if (!parsepairs(parser.values(tipoption),"tip",&tipfiles)) return false;
    if (parser.isSet(alphaoption) && !parselist(parser.value(alphaoption),"alpha",&alphas)) return false;
    if (parser.isSet(betaoption) && !parselist(parser.value(betaoption),"beta",&betas)) return false;
    if (parser.isSet(stepsizeoption))
    {
        bool ok;
        stepsize=parser.value(stepsizeoption).toDouble(&ok);
        if (!ok)
        {
            error=QString("Bad step-size '%1'").arg(parser.value(stepsizeoption));
            return false;
        }
    }
    if (!parsepairs(parser.values(branchenvoption),"branch-environment",&branchenvironmentfiles)) return false;
    if (parser.isSet(outputoption)) outputpath=parser.value(outputoption);
    if (parser.isSet(stuboption)) stub=parser.value(stuboption);
    if (parser.isSet(normaliseoption)) normalise=true;
    if (parser.isSet(delimiteroption) && !parsedelimiter(parser.value(delimiteroption))) return false;
    if (parser.isSet(verboseoption)) verbose=true;

    //3. refuse to run with settings that can't work
    if (treefile.isEmpty())
    {
        error="No tree file given (--tree)";
        return false;
    }
    if (tipfiles.isEmpty() && tipfolder.isEmpty())
    {
        error="No tip grids given (--tip or --tip-folder)";
        return false;
    }
    if (!(stepsize>0.0) || !qIsFinite(stepsize))
    {
        error=QString("Step size must be positive and finite, got %1").arg(stepsize);
        return false;
    }
    if (stub.isEmpty())
    {
        error="Output stub must not be empty";
        return false;
    }
    return true;
}


/////////////////////////////////////////////////////
//Logging
/////////////////////////////////////////////////////

void CommandLine::logtext(const QString &text, int level)
{
    if (level==OUTPUT_VERBOSE && !verbose) return;
    if (logstring)
    {
        logstring->append(text);
        logstring->append("\n");
        return;
    }
    QTextStream out(stdout);
    out<<text<<"\n";
    out.flush();
}

void CommandLine::setlogstring(QString *s)
{
    //divert log output into a string instead of stdout
    logstring=s;
}


/////////////////////////////////////////////////////
//Gets for run parameters / settings
/////////////////////////////////////////////////////

QString CommandLine::gettreefile()
{
    return treefile;
}

QString CommandLine::getenvironmentfile()
{
    return environmentfile;
}

QMap<QString,QString> CommandLine::gettipfiles()
{
    return tipfiles;
}

QString CommandLine::gettipfolder()
{
    return tipfolder;
}

QList<double> CommandLine::getalphas()
{
    return alphas;
}

QList<double> CommandLine::getbetas()
{
    return betas;
}

double CommandLine::getstepsize()
{
    return stepsize;
}

QMap<QString,QString> CommandLine::getbranchenvironmentfiles()
{
    return branchenvironmentfiles;
}

QString CommandLine::getoutputpath()
{
    return outputpath;
}

QString CommandLine::getstub()
{
    return stub;
}

bool CommandLine::getnormalise()
{
    return normalise;
}

QChar CommandLine::getdelimiter()
{
    return delimiter;
}

bool CommandLine::getverbose()
{
    return verbose;
}


/////////////////////////////////////////////////////
//Output file functions
/////////////////////////////////////////////////////

QString CommandLine::filesafe(const QString &name)
{
    //node labels can contain anything - keep file names to letters, digits and ._-
    QString s=name;
    for (int i=0; i<s.length(); i++)
    {
        QChar c=s.at(i);
        if (!(c.isLetterOrNumber() || c=='.' || c=='_' || c=='-')) s[i]='_';
    }
    return s;
}

QString CommandLine::parameterstring(double alpha, double beta)
{
    return QString("a%1_b%2").arg(alpha).arg(beta);
}

QString CommandLine::getgridfilename(const QString &node, double alpha, double beta)
{
    return QDir(outputpath).filePath(stub+"_"+parameterstring(alpha,beta)+"_node_"+filesafe(node)+".csv");
}

QString CommandLine::getsummaryfilename(double alpha, double beta)
{
    return QDir(outputpath).filePath(stub+"_"+parameterstring(alpha,beta)+"_summary.csv");
}

QString CommandLine::gettreefilename()
{
    return QDir(outputpath).filePath(stub+"_nodes.nwk");
}

QString CommandLine::summarytable(const QMap<QString,Grid> &grids, Lineage *root)
{
    //one line per internal node, post-order, with simple range statistics
    QString s;
    QTextStream out(&s);
    out<<"node,leaves,maximum,total,cells_above_half_max,centroid_row,centroid_col\n";

    QList<Lineage *> internal;
    root->getinternallist(&internal);
    foreach (Lineage *l, internal)
    {
        if (!grids.contains(l->identifier())) continue;
        const Grid &g=grids[l->identifier()];
        double m=g.max();
        double total=g.sum();
        int above=0;
        double rowsum=0.0, colsum=0.0;
        for (int i=0; i<g.rows(); i++)
            for (int q=0; q<g.cols(); q++)
            {
                double v=g.at(i,q);
                if (m>0.0 && v>=m*0.5) above++;
                rowsum+=v*i;
                colsum+=v*q;
            }

        out<<l->identifier()<<","<<l->count_leaves()<<","<<QString::number(m,'g',10)<<","<<QString::number(total,'g',10)<<","<<above<<",";
        if (total>0.0)
            out<<QString::number(rowsum/total,'g',10)<<","<<QString::number(colsum/total,'g',10)<<"\n";
        else
            out<<"NA,NA\n";
    }
    out.flush();
    return s;
}

bool CommandLine::do_grids(const QMap<QString,Grid> &grids, double alpha, double beta, Lineage *root)
{
    //write one grid file per internal node plus the summary table for this run
    if (!QDir().mkpath(outputpath))
    {
        logtext(QString("Error: couldn't create output folder '%1'").arg(outputpath));
        return false;
    }

    QMapIterator<QString,Grid> gi(grids);
    while (gi.hasNext())
    {
        gi.next();
        Grid g=normalise?gi.value().normalised():gi.value();
        SimulationError e;
        if (!g.writefile(getgridfilename(gi.key(),alpha,beta),delimiter,&e))
        {
            logtext("Error: "+e.toString());
            return false;
        }
    }

    QString fname=getsummaryfilename(alpha,beta);
    QFile f(fname);
    if (f.open(QIODevice::WriteOnly | QIODevice::Text)==false)
    {
        logtext(QString("Error: couldn't open summary file '%1' for output").arg(fname));
        return false;
    }
    QTextStream out(&f);
    out<<summarytable(grids,root);
    out.flush();
    f.close();
    return true;
}

bool CommandLine::do_tree(Lineage *root)
{
    //tree with internal node identifiers, so grid files can be matched to nodes
    if (!QDir().mkpath(outputpath))
    {
        logtext(QString("Error: couldn't create output folder '%1'").arg(outputpath));
        return false;
    }

    QString fname=gettreefilename();
    QFile f(fname);
    if (f.open(QIODevice::WriteOnly | QIODevice::Text)==false)
    {
        logtext(QString("Error: couldn't open tree file '%1' for output").arg(fname));
        return false;
    }
    f.write((root->newickstring()+";\n").toUtf8());
    f.close();
    return true;
}
