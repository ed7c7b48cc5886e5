#include "mainwindow.h"

#include <QApplication>

#ifdef _WIN32
#include <windows.h>
#endif

int main(int argc, char *argv[])
{
#ifdef _WIN32
    // All the decoder logging goes to std::cout
    AllocConsole();
    freopen("CONOUT$", "w", stdout);
    freopen("CONOUT$", "w", stderr);
#endif
    QApplication a(argc, argv);
    a.setApplicationName("DHT11 Decoder Simulator");

    MainWindow w;
    w.show();
    return a.exec();
}
