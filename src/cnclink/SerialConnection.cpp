#include "cnclink/SerialConnection.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace {

bool baudToSpeed(int baud, speed_t& speed) {
    switch (baud) {
    case 9600: speed = B9600; return true;
    case 19200: speed = B19200; return true;
    case 38400: speed = B38400; return true;
    case 57600: speed = B57600; return true;
    case 115200: speed = B115200; return true;
    case 230400: speed = B230400; return true;
#ifdef B250000
    case 250000: speed = B250000; return true;
#endif
    default: return false;
    }
}

}

SerialConnection::SerialConnection(const SerialConfig& config)
    : config_(config)
{
}

bool SerialConnection::connect(std::chrono::milliseconds /*timeout*/) {
    if (isConnected()) {
        return true;
    }
    if (!config_.isValid()) {
        setError("Invalid serial configuration");
        return false;
    }

    const int fd = ::open(config_.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        setError("Failed to open serial port: " + config_.port + " Error: " + std::string(strerror(errno)));
        return false;
    }

    // Back to blocking writes; reads are driven by poll()
    if (fcntl(fd, F_SETFL, 0) < 0) {
        setError("Failed to set serial fd flags: " + std::string(strerror(errno)));
        ::close(fd);
        return false;
    }

    if (!configurePort(fd)) {
        ::close(fd);
        return false;
    }

    attach(fd);
    std::cout << "Serial port opened: " << getDescription() << std::endl;
    return true;
}

bool SerialConnection::configurePort(int fd) {
    speed_t speed;
    if (!baudToSpeed(config_.baud_rate, speed)) {
        setError("Unsupported baud rate: " + std::to_string(config_.baud_rate));
        return false;
    }

    tcflush(fd, TCIOFLUSH);

    struct termios options;
    if (tcgetattr(fd, &options) != 0) {
        setError("Failed to get serial attributes: " + std::string(strerror(errno)));
        return false;
    }

    cfsetispeed(&options, speed);
    cfsetospeed(&options, speed);
    options.c_cflag |= (CLOCAL | CREAD);
    options.c_cflag &= ~CRTSCTS;
    options.c_cflag &= ~PARENB;
    options.c_cflag &= ~CSTOPB;
    options.c_cflag &= ~CSIZE;
    options.c_cflag |= CS8;
    options.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);
    options.c_iflag &= ~(IXON | IXOFF | IXANY | ICRNL | INLCR | IGNCR);
    options.c_oflag &= ~OPOST;
    options.c_cc[VMIN] = 0;
    options.c_cc[VTIME] = 1;

    if (tcsetattr(fd, TCSANOW, &options) != 0) {
        setError("Failed to set serial attributes: " + std::string(strerror(errno)));
        return false;
    }
    return true;
}

std::string SerialConnection::getDescription() const {
    return "Serial " + config_.port + " @ " + std::to_string(config_.baud_rate);
}
