// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <termios.h>
#include <unistd.h>

#include "serial_channel.hpp"
#include "conch_log.hpp"

namespace {

speed_t BaudrateToSpeed(int baudrate)
{
    switch (baudrate) {
        case 9600:    return B9600;
        case 19200:   return B19200;
        case 38400:   return B38400;
        case 57600:   return B57600;
        case 115200:  return B115200;
        case 230400:  return B230400;
        case 460800:  return B460800;
        case 921600:  return B921600;
        case 1500000: return B1500000;
        default:
            throw std::invalid_argument("Unsupported baudrate: " + std::to_string(baudrate));
    }
}

}

SerialChannel::SerialChannel(const std::string &name, const std::string &device, int baudrate)
    : FdChannel{name}, m_device{device}, m_baudrate{baudrate}
{
    CONCH_LOG;

    Open();
}

SerialChannel::~SerialChannel()
{
    CONCH_LOG;

    Close();
}

void SerialChannel::Open()
{
    CONCH_LOG;

    speed_t speed = BaudrateToSpeed(m_baudrate);

    int fd = open(m_device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "Failed to open " << m_device << ": " << std::strerror(errno) << endLog;
        throw std::runtime_error("Failed to open " + m_device + ": " + std::strerror(errno));
    }

    termios tty{};
    if (tcgetattr(fd, &tty) != 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "tcgetattr failed: " << std::strerror(errno) << endLog;
        close(fd);
        throw std::runtime_error("Failed to configure " + m_device);
    }

    cfmakeraw(&tty);
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~CRTSCTS;
    tty.c_cflag &= ~CSTOPB;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tty) != 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "tcsetattr failed: " << std::strerror(errno) << endLog;
        close(fd);
        throw std::runtime_error("Failed to configure " + m_device);
    }

    if (SetFd(fd) < 0) {
        close(fd);
        throw std::runtime_error("Failed to configure " + m_device);
    }

    log(CONCH_LOG_LEVEL_INFO) << "Opened " << m_device << " at " << m_baudrate << " baud" << endLog;
}
