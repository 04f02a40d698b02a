#include "app/AppBootstrap.h"
#include <QCoreApplication>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("StrangleSeller");
    app.setApplicationVersion("1.0.0");

    AppBootstrap bootstrap(&app);
    return bootstrap.run();
}
