#include "common/io_utils.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>

namespace sandbox {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    if (!fin) throw system_error(errno, generic_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (0x00 <= c && c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  //U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

// 返回以 lead 开头的 UTF-8 字符所占的字节数
static size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    return 4;
}

u32string utf8_decode(const string &str) {
    u32string result;
    result.reserve(str.size());
    if (!utf8_check_is_valid(str)) {
        for (unsigned char c : str) result.push_back(c);
        return result;
    }

    for (size_t i = 0; i < str.size();) {
        unsigned char lead = str[i];
        size_t len = utf8_sequence_length(lead);
        char32_t cp = len == 1 ? lead : lead & (0xFF >> (len + 1));
        for (size_t k = 1; k < len; ++k)
            cp = (cp << 6) | ((unsigned char)str[i + k] & 0x3F);
        result.push_back(cp);
        i += len;
    }
    return result;
}

string utf8_prefix(const string &str, size_t count) {
    if (!utf8_check_is_valid(str)) return str.substr(0, count);
    size_t i = 0;
    for (size_t chars = 0; i < str.size() && chars < count; ++chars)
        i += utf8_sequence_length(str[i]);
    return str.substr(0, i);
}

size_t utf8_length(const string &str) {
    if (!utf8_check_is_valid(str)) return str.size();
    size_t chars = 0;
    for (size_t i = 0; i < str.size(); ++chars)
        i += utf8_sequence_length(str[i]);
    return chars;
}

void utf8_truncate(string &str, size_t limit) {
    if (str.size() <= limit) return;
    size_t end = limit;
    // 最多后退 3 个延续字节找到字符的首字节
    for (size_t back = 0; back < 3 && end > 0 && ((unsigned char)str[end] & 0xC0) == 0x80; ++back)
        --end;
    if (((unsigned char)str[end] & 0xC0) == 0x80) end = limit;
    str.resize(end);
}

unique_fd::unique_fd() : fd(-1) {}

unique_fd::unique_fd(int fd) : fd(fd) {}

unique_fd::unique_fd(unique_fd &&other) : fd(-1) {
    *this = move(other);
}

unique_fd::~unique_fd() {
    if (fd >= 0) ::close(fd);
}

unique_fd &unique_fd::operator=(unique_fd &&other) {
    swap(fd, other.fd);
    return *this;
}

int unique_fd::get() const {
    return fd;
}

int unique_fd::release() {
    int result = fd;
    fd = -1;
    return result;
}

void unique_fd::reset() {
    if (fd < 0) return;
    int old = release();
    if (::close(old) != 0)
        throw system_error(errno, generic_category(), "close");
}

unique_fd::operator bool() const {
    return fd >= 0;
}

void make_pipe(unique_fd &read_end, unique_fd &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, generic_category(), "unable to create pipe");
    read_end = unique_fd(fds[0]);
    write_end = unique_fd(fds[1]);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw system_error(errno, generic_category(), "fcntl, setting O_NONBLOCK");
}

void write_fully(int fd, const string &data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, generic_category(), "write");
        }
        written += n;
    }
}

string read_fully(int fd) {
    string result;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, generic_category(), "read");
        }
        if (n == 0) break;
        result.append(buf, n);
    }
    return result;
}

}  // namespace sandbox
