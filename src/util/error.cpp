#include "util/error.hpp"

extern "C" {
#include <stdint.h>
#include <string.h>
#include <unistd.h>
}

const TError OK;

namespace {

struct TErrorHeader {
    int32_t Error;
    int32_t Errno;
    uint32_t Length;
};

/* 1 - done, 0 - eof before first byte, -1 - error or short stream */
int ReadFull(int fd, void *buf, size_t len) {
    char *ptr = static_cast<char *>(buf);
    size_t done = 0;

    while (done < len) {
        ssize_t ret = read(fd, ptr + done, len - done);
        if (ret < 0 && errno == EINTR)
            continue;
        if (ret < 0)
            return -1;
        if (ret == 0) {
            errno = EPIPE;
            return done ? -1 : 0;
        }
        done += ret;
    }

    return 1;
}

}

std::string TError::ErrorName(EError error) {
    return rpc::EError_Name(error);
}

std::string TError::Message() const {
    if (!Errno)
        return Text;
    return fmt::format("{}: {}", Text, strerror(Errno));
}

std::string TError::ToString() const {
    std::string name = ErrorName(Error);

    if (Errno)
        return fmt::format("{}:({}: {})", name, strerror(Errno), Text);
    if (!Text.empty())
        return fmt::format("{}:({})", name, Text);
    return name;
}

TError TError::Serialize(int fd) const {
    std::string text = Text.substr(0, MAX_TEXT);
    TErrorHeader header;

    header.Error = Error;
    header.Errno = Errno;
    header.Length = text.size();

    std::string record(reinterpret_cast<const char *>(&header), sizeof(header));
    record += text;

    size_t done = 0;
    while (done < record.size()) {
        ssize_t ret = write(fd, record.data() + done, record.size() - done);
        if (ret < 0 && errno == EINTR)
            continue;
        if (ret < 0)
            return System("Cannot send error record");
        done += ret;
    }

    return OK;
}

bool TError::Deserialize(int fd, TError &error) {
    TErrorHeader header;

    int ret = ReadFull(fd, &header, sizeof(header));
    if (ret == 0)
        return false;

    if (ret < 0) {
        error = System("Cannot receive error record");
        return true;
    }

    if (!rpc::EError_IsValid(header.Error) || header.Length > MAX_TEXT) {
        error = TError(EError::Unknown, "Malformed error record: error {} length {}",
                       header.Error, header.Length);
        return true;
    }

    std::string text(header.Length, '\0');
    if (header.Length && ReadFull(fd, &text[0], header.Length) <= 0) {
        error = System("Cannot receive error text");
        return true;
    }

    error = TError(static_cast<EError>(header.Error), header.Errno, text);
    return true;
}
