#include "ranker_cli.h"
#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("shoprank-cli"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    sr::RankerCli cli;
    return cli.run(app.arguments());
}
