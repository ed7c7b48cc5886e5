#include <QSettings>

#include "mainwindow.h"
#include "./ui_mainwindow.h"
#include "simulator.hpp"

static MainWindow* g_main;

// Simulated time advances by ui->speed microseconds every period
#define TIMER_PERIOD_MS 10

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , ui(new Ui::MainWindow), serial(new QSerialPort(this)), timer(new QTimer(this))
{
    ui->setupUi(this);
    connect(serial, &QSerialPort::readyRead, this, &MainWindow::readData);
    connect(timer, &QTimer::timeout, this, &MainWindow::onTimer);

    leds[0] = ui->led0;
    leds[1] = ui->led1;
    leds[2] = ui->led2;
    leds[3] = ui->led3;

    // For UI update callbacks
    g_main = this;
    initSimulator();

    loadSettings();

    // Set initial values from the UI
    on_applyConfig_clicked();
    sendSensorConfig();
    setReplaySource(ui->sourceSelector->currentIndex() == 1);
    setDumpAllPackets(ui->dumpAllPackets->isChecked());
    updateLeds();

    connect(ui->humidity, QOverload<int>::of(&QSpinBox::valueChanged), this, &MainWindow::onSensorChanged);
    connect(ui->humidityDecimal, QOverload<int>::of(&QSpinBox::valueChanged), this, &MainWindow::onSensorChanged);
    connect(ui->temperature, QOverload<int>::of(&QSpinBox::valueChanged), this, &MainWindow::onSensorChanged);
    connect(ui->temperatureDecimal, QOverload<int>::of(&QSpinBox::valueChanged), this, &MainWindow::onSensorChanged);
    connect(ui->stallAfterBits, QOverload<int>::of(&QSpinBox::valueChanged), this, &MainWindow::onSensorChanged);
    connect(ui->respondsToStart, &QCheckBox::toggled, this, &MainWindow::onSensorChanged);
    connect(ui->corruptChecksum, &QCheckBox::toggled, this, &MainWindow::onSensorChanged);
    connect(ui->sw0, &QCheckBox::toggled, this, &MainWindow::updateLeds);
    connect(ui->sw1, &QCheckBox::toggled, this, &MainWindow::updateLeds);
}

MainWindow::~MainWindow()
{
    saveSettings();
    delete ui;
}

void MainWindow::loadSettings()
{
    QSettings s("DHT11", "DecoderSimulator");

    ui->frequency->setValue(s.value("decoder/frequency", ui->frequency->value()).toInt());
    ui->startUs->setValue(s.value("decoder/start_us", ui->startUs->value()).toInt());
    ui->warmUs->setValue(s.value("decoder/warm_us", ui->warmUs->value()).toInt());

    ui->humidity->setValue(s.value("sensor/humidity", ui->humidity->value()).toInt());
    ui->humidityDecimal->setValue(s.value("sensor/humidity_decimal", ui->humidityDecimal->value()).toInt());
    ui->temperature->setValue(s.value("sensor/temperature", ui->temperature->value()).toInt());
    ui->temperatureDecimal->setValue(s.value("sensor/temperature_decimal", ui->temperatureDecimal->value()).toInt());
    ui->sourceSelector->setCurrentIndex(s.value("sensor/source", ui->sourceSelector->currentIndex()).toInt());

    ui->sw0->setChecked(s.value("board/sw0", false).toBool());
    ui->sw1->setChecked(s.value("board/sw1", false).toBool());

    ui->speed->setValue(s.value("simulation/speed", ui->speed->value()).toInt());
    ui->portName->setText(s.value("serial/port", ui->portName->text()).toString());
    ui->dumpAllPackets->setChecked(s.value("serial/dump_all", false).toBool());
}

// Faults are not saved on purpose; a restarted simulator gets a healthy sensor
void MainWindow::saveSettings()
{
    QSettings s("DHT11", "DecoderSimulator");

    s.setValue("decoder/frequency", ui->frequency->value());
    s.setValue("decoder/start_us", ui->startUs->value());
    s.setValue("decoder/warm_us", ui->warmUs->value());

    s.setValue("sensor/humidity", ui->humidity->value());
    s.setValue("sensor/humidity_decimal", ui->humidityDecimal->value());
    s.setValue("sensor/temperature", ui->temperature->value());
    s.setValue("sensor/temperature_decimal", ui->temperatureDecimal->value());
    s.setValue("sensor/source", ui->sourceSelector->currentIndex());

    s.setValue("board/sw0", ui->sw0->isChecked());
    s.setValue("board/sw1", ui->sw1->isChecked());

    s.setValue("simulation/speed", ui->speed->value());
    s.setValue("serial/port", ui->portName->text());
    s.setValue("serial/dump_all", ui->dumpAllPackets->isChecked());
}

void MainWindow::on_commButton_clicked()
{
    if (comm_running) {
        closeSerial(serial);
        ui->commButton->setText("Connect");
        ui->portName->setDisabled(false);
        comm_running = false;
    } else {
        QString err = openSerial(serial, ui->portName->text());

        if (err.isEmpty()) {
            ui->portName->setDisabled(true);
            ui->commButton->setText("Disconnect");
            comm_running = true;
        } else {
            ui->statusbar->showMessage(err);
        }
    }
}

void MainWindow::readData()
{
    serialRead(serial);
}

void MainWindow::onTimer()
{
    runSimulation(ui->speed->value());
}

void MainWindow::setRunning(bool running)
{
    if (running) {
        timer->start(TIMER_PERIOD_MS);
        ui->runButton->setText("Pause");
    } else {
        timer->stop();
        ui->runButton->setText("Run");
    }
}

void MainWindow::on_applyConfig_clicked()
{
    Config config;

    config.samplingFrequency = ui->frequency->value();
    config.start_us          = ui->startUs->value();
    config.warm_us           = ui->warmUs->value();

    QString err = applyConfig(config);

    if (err.isEmpty()) {
        ui->statusbar->showMessage("Decoder restarted", 2000);
    } else {
        ui->statusbar->showMessage(err);
    }
}

void MainWindow::on_runButton_clicked()
{
    setRunning(!timer->isActive());
}

void MainWindow::on_resetButton_clicked()
{
    resetSimulation();
    ui->readingLabel->setText("-");
    ui->wordLabel->setText("0x00000000");
    updateLeds();
}

void MainWindow::on_sourceSelector_currentIndexChanged(int index)
{
    // Keep in sync with ComboBox items in UI definition! 0 - Simulated, 1 - Replay
    setReplaySource(index == 1);
}

void MainWindow::on_dumpAllPackets_stateChanged(int arg1)
{
    setDumpAllPackets(arg1 == Qt::Checked);
}

void MainWindow::onSensorChanged()
{
    sendSensorConfig();
}

void MainWindow::sendSensorConfig()
{
    SensorConfig config;

    config.humidity           = ui->humidity->value();
    config.humidityDecimal    = ui->humidityDecimal->value();
    config.temperature        = ui->temperature->value();
    config.temperatureDecimal = ui->temperatureDecimal->value();
    config.respondsToStart    = ui->respondsToStart->isChecked();
    config.corruptChecksum    = ui->corruptChecksum->isChecked();
    // Minimum of the spin box is "Never"
    config.stallAfterBits     = ui->stallAfterBits->value();

    setSensorConfig(config);
}

void MainWindow::updateLeds()
{
    uint8_t v = getLeds(ui->sw0->isChecked(), ui->sw1->isChecked());

    for (int i = 0; i < 4; i++) {
        leds[i]->setStyleSheet((v & (1 << i)) ? "background-color: red" : "background-color: gray");
    }
}

void MainWindow::updateReading(const Reading& r, uint32_t word)
{
    ui->readingLabel->setText(QString("%1% %2C checksum %3 %4")
                              .arg(int(r.humidity))
                              .arg(int(r.temperature))
                              .arg(int(r.checksum), 2, 16, QChar('0'))
                              .arg(r.checksumOk ? "OK" : "BAD"));
    ui->wordLabel->setText(QString("0x%1").arg(word, 8, 16, QChar('0')));
    updateLeds();
}

void MainWindow::updateCounters(unsigned int acquisitions, unsigned int timeouts,
                                unsigned int checksum_errors, unsigned int pending)
{
    ui->countersLabel->setText(QString("%1 readings, %2 timeouts, %3 bad checksums, %4 captures queued")
                               .arg(acquisitions).arg(timeouts).arg(checksum_errors).arg(pending));
}

// These are called from within simulator.cpp in order to update the UI state
void ui_UpdateReading(const Reading& r, uint32_t word)
{
    g_main->updateReading(r, word);
}

void ui_UpdateCounters(unsigned int acquisitions, unsigned int timeouts,
                       unsigned int checksum_errors, unsigned int pending)
{
    g_main->updateCounters(acquisitions, timeouts, checksum_errors, pending);
}
