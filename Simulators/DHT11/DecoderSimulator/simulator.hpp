#ifndef SIMULATOR_H
#define SIMULATOR_H

#include <QSerialPort>

#include "dht11_ctrl.hpp"
#include "sensor.hpp"

void initSimulator();

QString openSerial(QSerialPort* serial, const QString& port);
void closeSerial(QSerialPort* serial);
void serialRead(QSerialPort* serial);

QString applyConfig(const Config& config);
void setSensorConfig(const SensorConfig& config);
void setReplaySource(bool on);
void setDumpAllPackets(bool on);

void runSimulation(unsigned int us);
void resetSimulation();
uint8_t getLeds(bool sw0, bool sw1);

void ui_UpdateReading(const Reading& r, uint32_t word);
void ui_UpdateCounters(unsigned int acquisitions, unsigned int timeouts,
                       unsigned int checksum_errors, unsigned int pending);

#endif // SIMULATOR_H
