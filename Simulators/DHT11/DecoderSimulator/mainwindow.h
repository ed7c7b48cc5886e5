#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QLabel>
#include <QMainWindow>
#include <QSerialPort>
#include <QTimer>

#include "reading.hpp"

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
QT_END_NAMESPACE

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(QWidget *parent = nullptr);
    ~MainWindow();

    void updateReading(const Reading& r, uint32_t word);
    void updateCounters(unsigned int acquisitions, unsigned int timeouts,
                        unsigned int checksum_errors, unsigned int pending);

private slots:
    void on_commButton_clicked();
    void readData();
    void onTimer();

    void on_applyConfig_clicked();

    void on_runButton_clicked();

    void on_resetButton_clicked();

    void on_sourceSelector_currentIndexChanged(int index);

    void on_dumpAllPackets_stateChanged(int arg1);

    void onSensorChanged();

    void updateLeds();

private:
    void loadSettings();
    void saveSettings();
    void sendSensorConfig();
    void setRunning(bool running);

    Ui::MainWindow *ui;

    QSerialPort* serial;
    QTimer* timer;
    QLabel* leds[4];
    bool comm_running = false;
};
#endif // MAINWINDOW_H
