#ifndef DEVICE_READER_HPP
#define DEVICE_READER_HPP

#include "input/key_event.hpp"

#include <deque>
#include <optional>
#include <string>

#include <linux/input.h>

class ShutdownSignal;

// Reduces one raw evdev record to a trigger-key edge. Autorepeat (value 2),
// other codes and non-EV_KEY records yield nullopt.
std::optional<KeyEvent> decodeKeyEvent(const input_event& ev, uint16_t keyCode);

// Reads struct input_event records from a device node and yields the edges
// of one key. Blocking reads are interrupted by the shutdown signal.
class DeviceReader : public KeySource {
public:
    DeviceReader(uint16_t keyCode, const ShutdownSignal& shutdown);
    ~DeviceReader() override;

    DeviceReader(const DeviceReader&) = delete;
    DeviceReader& operator=(const DeviceReader&) = delete;

    Result<void> open(const std::string& path) override;
    Result<KeyEvent> next() override;
    void close() override;

    const std::string& path() const { return path_; }

private:
    Result<void> fill();
    void push(KeyEvent event);
    void resync();

    uint16_t keyCode_;
    const ShutdownSignal& shutdown_;
    int fd_ = -1;
    std::string path_;
    bool keyDown_ = false;
    bool timestamped_ = false;
    std::deque<KeyEvent> pending_;
};

#endif
