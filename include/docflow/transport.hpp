#pragma once

#include <functional>
#include <memory>
#include <string>

namespace docflow {

struct CloseInfo {
    bool clean = false;   // orderly close by either side
    std::string reason;
};

/**
 * One duplex text-message connection.
 *
 * open() starts connecting; afterwards exactly one of on_open or
 * on_close(clean=false) is reported, and after on_open the connection ends
 * with a single on_close. write() queues a message and returns immediately;
 * neither write() nor close() invokes handlers synchronously.
 */
class Transport {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const std::string&)> on_message;
        std::function<void(const CloseInfo&)> on_close;
    };

    virtual ~Transport() = default;

    virtual void open(Handlers handlers) = 0;
    virtual void write(std::string text) = 0;
    virtual void close(const std::string& reason) = 0;
};

// Produces a fresh transport for every connection attempt
using TransportFactory = std::function<std::shared_ptr<Transport>()>;

} // namespace docflow
