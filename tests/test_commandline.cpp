#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include "commandline.h"
#include "simulation.h"
#include "lineage.h"

static void writetext(const QString &fname, const QString &text)
{
    QFile f(fname);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Text));
    QTextStream out(&f);
    out<<text;
}

static QString readtext(const QString &fname)
{
    QFile f(fname);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) return QString();
    return QTextStream(&f).readAll();
}

TEST(CommandLineTest, MinimalOptionsTakeDefaults)
{
    CommandLine cl;
    ASSERT_TRUE(cl.parse(QStringList()<<"phylorange"<<"--tree"<<"t.nwk"<<"--tip"<<"A=a.csv"<<"--tip"<<"B=b.csv"))
            <<cl.errorString().toStdString();
    EXPECT_EQ("t.nwk",cl.gettreefile().toStdString());
    EXPECT_EQ(2,cl.gettipfiles().count());
    EXPECT_EQ("b.csv",cl.gettipfiles().value("B").toStdString());
    ASSERT_EQ(1,cl.getalphas().count());
    EXPECT_DOUBLE_EQ(0.5,cl.getalphas().at(0));
    EXPECT_DOUBLE_EQ(0.5,cl.getbetas().at(0));
    EXPECT_DOUBLE_EQ(1.0,cl.getstepsize());
    EXPECT_EQ("phylorange",cl.getstub().toStdString());
    EXPECT_EQ(QChar(','),cl.getdelimiter());
    EXPECT_FALSE(cl.getnormalise());
    EXPECT_TRUE(cl.getenvironmentfile().isEmpty());
}

TEST(CommandLineTest, ParsesSweepAndOptions)
{
    CommandLine cl;
    ASSERT_TRUE(cl.parse(QStringList()<<"phylorange"<<"--tree=t.nwk"<<"--tip-folder"<<"tips"
                         <<"--alpha"<<"0.1, 0.2,0.3"<<"--beta"<<"0.9"<<"--step-size"<<"0.25"
                         <<"--branch-environment"<<"X=dark.csv"<<"--delimiter"<<"tab"
                         <<"--normalise"<<"--verbose"<<"--stub"<<"run1"))
            <<cl.errorString().toStdString();
    EXPECT_EQ(3,cl.getalphas().count());
    EXPECT_DOUBLE_EQ(0.3,cl.getalphas().at(2));
    EXPECT_EQ(1,cl.getbetas().count());
    EXPECT_DOUBLE_EQ(0.25,cl.getstepsize());
    EXPECT_EQ("dark.csv",cl.getbranchenvironmentfiles().value("X").toStdString());
    EXPECT_EQ(QChar('\t'),cl.getdelimiter());
    EXPECT_TRUE(cl.getnormalise());
    EXPECT_TRUE(cl.getverbose());
    EXPECT_EQ("tips",cl.gettipfolder().toStdString());
}

TEST(CommandLineTest, RejectsUnusableSettings)
{
    QStringList base=QStringList()<<"phylorange"<<"--tip"<<"A=a.csv";
    CommandLine nottree;
    EXPECT_FALSE(nottree.parse(base));
    EXPECT_TRUE(nottree.errorString().contains("tree"));

    base<<"--tree"<<"t.nwk";
    CommandLine zerostep;
    EXPECT_FALSE(zerostep.parse(QStringList(base)<<"--step-size"<<"0"));
    CommandLine infinitestep;
    EXPECT_FALSE(infinitestep.parse(QStringList(base)<<"--step-size"<<"inf"));
    CommandLine badstep;
    EXPECT_FALSE(badstep.parse(QStringList(base)<<"--step-size"<<"fast"));
    CommandLine badalpha;
    EXPECT_FALSE(badalpha.parse(QStringList(base)<<"--alpha"<<"0.1,x"));
    CommandLine badtip;
    EXPECT_FALSE(badtip.parse(QStringList(base)<<"--tip"<<"nofile"));
    CommandLine baddelimiter;
    EXPECT_FALSE(baddelimiter.parse(QStringList(base)<<"--delimiter"<<"::"));
    CommandLine unknown;
    EXPECT_FALSE(unknown.parse(QStringList(base)<<"--frobnicate"));

    CommandLine notips;
    EXPECT_FALSE(notips.parse(QStringList()<<"phylorange"<<"--tree"<<"t.nwk"));
}

TEST(CommandLineTest, HelpIsReported)
{
    CommandLine cl;
    ASSERT_TRUE(cl.parse(QStringList()<<"phylorange"<<"--help"));
    EXPECT_TRUE(cl.helprequested());
    EXPECT_TRUE(cl.helptext().contains("--tree"));
}

TEST(CommandLineTest, ConfigFileSuppliesDefaultsAndOptionsWin)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString ini=QDir(dir.path()).filePath("run.ini");
    writetext(ini,"[run]\n"
                  "tree=tree.nwk\n"
                  "alpha=0.1,0.3\n"
                  "beta=0.2\n"
                  "step-size=2\n"
                  "normalise=true\n"
                  "stub=fromfile\n"
                  "\n"
                  "[tips]\n"
                  "A=a.csv\n"
                  "B=/abs/b.csv\n");

    CommandLine cl;
    ASSERT_TRUE(cl.parse(QStringList()<<"phylorange"<<"--config"<<ini<<"--beta"<<"0.7"))
            <<cl.errorString().toStdString();
    EXPECT_EQ(QDir(dir.path()).filePath("tree.nwk").toStdString(),cl.gettreefile().toStdString());
    EXPECT_EQ(2,cl.getalphas().count());
    EXPECT_DOUBLE_EQ(0.3,cl.getalphas().at(1));
    ASSERT_EQ(1,cl.getbetas().count());
    EXPECT_DOUBLE_EQ(0.7,cl.getbetas().at(0));
    EXPECT_DOUBLE_EQ(2.0,cl.getstepsize());
    EXPECT_TRUE(cl.getnormalise());
    EXPECT_EQ("fromfile",cl.getstub().toStdString());
    EXPECT_EQ(QDir(dir.path()).filePath("a.csv").toStdString(),cl.gettipfiles().value("A").toStdString());
    EXPECT_EQ("/abs/b.csv",cl.gettipfiles().value("B").toStdString());
}

TEST(CommandLineTest, MissingConfigFileIsAnError)
{
    CommandLine cl;
    EXPECT_FALSE(cl.parse(QStringList()<<"phylorange"<<"--config"<<"/nonexistent/run.ini"));
    EXPECT_TRUE(cl.errorString().contains("run.ini"));
}

TEST(CommandLineTest, OutputFileNames)
{
    CommandLine cl;
    ASSERT_TRUE(cl.parse(QStringList()<<"phylorange"<<"--tree"<<"t"<<"--tip"<<"A=a"<<"--output"<<"out"<<"--stub"<<"s"));
    EXPECT_EQ("out/s_a0.5_b0.25_node_n3.csv",cl.getgridfilename("n3",0.5,0.25).toStdString());
    EXPECT_EQ("out/s_a0.5_b0.25_node_My_node_.csv",cl.getgridfilename("My node?",0.5,0.25).toStdString());
    EXPECT_EQ("out/s_a1_b0_summary.csv",cl.getsummaryfilename(1.0,0.0).toStdString());
    EXPECT_EQ("out/s_nodes.nwk",cl.gettreefilename().toStdString());
}

TEST(CommandLineTest, SummaryTableListsInternalNodesInPostOrder)
{
    Lineage *root=Lineage::fromnewick("((A,B)X,C)R;");
    ASSERT_TRUE(root!=nullptr);
    QMap<QString,Grid> grids;
    Grid x(2,2);
    x.set(0,0,1.0);
    x.set(1,1,1.0);
    grids.insert("X",x);
    grids.insert("R",Grid(2,2));

    CommandLine cl;
    QString table=cl.summarytable(grids,root);
    QStringList lines=table.split('\n',QString::SkipEmptyParts);
    ASSERT_EQ(3,lines.count());
    EXPECT_TRUE(lines.at(0).startsWith("node,leaves"));
    EXPECT_EQ("X,2,1,2,2,0.5,0.5",lines.at(1).toStdString());
    EXPECT_EQ("R,3,0,0,0,NA,NA",lines.at(2).toStdString());
    delete root;
}


/////////////////////////////////////////////////////
//Whole run from files to output folder
/////////////////////////////////////////////////////

TEST(RunTest, WritesNodeGridsSummaryAndTree)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QDir d(dir.path());
    writetext(d.filePath("tree.nwk"),"((A:1,B:2)X:1,C:1)R;\n");
    d.mkdir("tips");
    writetext(d.filePath("tips/A.csv"),"1,1,0\n0,0,0\n0,0,0\n");
    writetext(d.filePath("tips/B.csv"),"0,0,0\n0,1,0\n0,1,1\n");
    writetext(d.filePath("tips/C.csv"),"0,0,1\n0,1,1\n0,0,0\n");
    writetext(d.filePath("env.csv"),"1 1 0.5\n1 1 0.5\n0.8 0.8 0.8\n");

    CommandLine cl;
    QString log;
    cl.setlogstring(&log);
    ASSERT_TRUE(cl.parse(QStringList()<<"phylorange"<<"--tree"<<d.filePath("tree.nwk")
                         <<"--tip-folder"<<d.filePath("tips")<<"--environment"<<d.filePath("env.csv")
                         <<"--alpha"<<"0.3,0.6"<<"--beta"<<"0.5"<<"--output"<<d.filePath("out")<<"--stub"<<"t"))
            <<cl.errorString().toStdString();

    Simulation sim;
    ASSERT_TRUE(sim.run(&cl))<<log.toStdString();
    EXPECT_TRUE(log.contains("...Done!"));

    QDir out(d.filePath("out"));
    EXPECT_TRUE(QFileInfo::exists(out.filePath("t_nodes.nwk")));
    EXPECT_EQ("((A:1,B:2)X:1,C:1)R;\n",readtext(out.filePath("t_nodes.nwk")).toStdString());
    EXPECT_TRUE(QFileInfo::exists(out.filePath("t_a0.3_b0.5_node_X.csv")));
    EXPECT_TRUE(QFileInfo::exists(out.filePath("t_a0.6_b0.5_node_R.csv")));
    EXPECT_TRUE(QFileInfo::exists(out.filePath("t_a0.6_b0.5_summary.csv")));

    //grid written for R matches a direct reconstruction
    SimulationError e;
    Grid env=Grid::readfile(d.filePath("env.csv"),&e);
    Grid a=Grid::readfile(d.filePath("tips/A.csv"),&e);
    Grid b=Grid::readfile(d.filePath("tips/B.csv"),&e);
    Grid c=Grid::readfile(d.filePath("tips/C.csv"),&e);
    ASSERT_FALSE(e.isError());
    Grid x=Simulation::combine(Simulation::propagate(a,env,0.6,0.5,1),Simulation::propagate(b,env,0.6,0.5,2));
    Grid r=Simulation::combine(Simulation::propagate(x,env,0.6,0.5,1),Simulation::propagate(c,env,0.6,0.5,1));
    Grid written=Grid::readfile(out.filePath("t_a0.6_b0.5_node_R.csv"),&e);
    ASSERT_FALSE(e.isError());
    EXPECT_TRUE(written==r);
}

TEST(RunTest, MissingTipStopsTheRun)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QDir d(dir.path());
    writetext(d.filePath("tree.nwk"),"(A:1,B:1)R;");
    writetext(d.filePath("A.csv"),"1,0\n0,0\n");

    CommandLine cl;
    QString log;
    cl.setlogstring(&log);
    ASSERT_TRUE(cl.parse(QStringList()<<"phylorange"<<"--tree"<<d.filePath("tree.nwk")
                         <<"--tip"<<"A="+d.filePath("A.csv")<<"--output"<<d.filePath("out")));
    Simulation sim;
    EXPECT_FALSE(sim.run(&cl));
    EXPECT_TRUE(log.contains("Invalid topology"));
    EXPECT_EQ(SimulationError::InvalidTopology,sim.lastError().kind);
}
