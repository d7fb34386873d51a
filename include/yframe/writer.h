#pragma once

#include <yframe/result.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace yframe {

//=============================================================================
// Writer - output channel of a terminal session
//
// write() either delivers every byte or fails. No retries happen above this
// layer.
//=============================================================================

class Writer {
public:
    using Ptr = std::shared_ptr<Writer>;

    virtual ~Writer() = default;

    virtual Result<void> write(std::string_view bytes) = 0;
};

// Writes to a file descriptor, handling EINTR and partial writes
class FdWriter : public Writer {
public:
    static Result<Ptr> create(int fd) noexcept;

    Result<void> write(std::string_view bytes) override;

    int fd() const { return _fd; }

private:
    explicit FdWriter(int fd) : _fd(fd) {}

    int _fd;
};

// Collects output in memory
class StringWriter : public Writer {
public:
    using Ptr = std::shared_ptr<StringWriter>;

    static Ptr create() { return Ptr(new StringWriter()); }

    Result<void> write(std::string_view bytes) override {
        _data.append(bytes);
        _writes++;
        return Ok();
    }

    const std::string& data() const { return _data; }

    // Number of write() calls
    size_t writeCount() const { return _writes; }

    void clear() {
        _data.clear();
        _writes = 0;
    }

private:
    StringWriter() = default;

    std::string _data;
    size_t _writes = 0;
};

} // namespace yframe
