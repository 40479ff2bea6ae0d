#include <clipstash/storage/file_util.hpp>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace clipstash {
namespace storage {

namespace fs = std::filesystem;

ErrorCode map_io_error(const std::error_code& ec, ErrorCode fallback) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorCode::STORAGE_ACCESS_DENIED;
    }
    if (ec == std::errc::read_only_file_system) {
        return ErrorCode::STORAGE_ACCESS_DENIED;
    }
    if (ec == std::errc::not_a_directory || ec == std::errc::filename_too_long) {
        return ErrorCode::STORAGE_PATH_UNAVAILABLE;
    }
    return fallback;
}

Result<void> ensure_directory(const fs::path& dir) {
    if (dir.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        ErrorCode code = map_io_error(ec, ErrorCode::STORAGE_DIRECTORY_CREATE_FAILED);
        return Error(code, "Cannot create directory " + dir.string() + ": " + ec.message());
    }
    return Ok();
}

Result<std::optional<std::string>> read_file(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        ErrorCode code = map_io_error(ec, ErrorCode::STORAGE_READ_FAILED);
        return Error(code, "Cannot stat " + path.string() + ": " + ec.message());
    }
    if (!fs::exists(status)) {
        return std::optional<std::string>();
    }
    if (fs::is_directory(status)) {
        return Error(ErrorCode::STORAGE_PATH_UNAVAILABLE, path.string() + " is a directory");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code open_ec(errno, std::generic_category());
        ErrorCode code = map_io_error(open_ec, ErrorCode::STORAGE_READ_FAILED);
        return Error(code, "Cannot open " + path.string());
    }

    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error(ErrorCode::STORAGE_READ_FAILED, "Read error on " + path.string());
    }
    return std::optional<std::string>(std::move(data));
}

Result<void> write_file_atomic(const fs::path& path, const std::string& data) {
    auto dir_result = ensure_directory(path.parent_path());
    if (!dir_result.ok()) {
        return dir_result;
    }

    fs::path temp = path;
    temp += ".tmp";

    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        std::error_code ec(errno, std::generic_category());
        return Error(map_io_error(ec, ErrorCode::STORAGE_WRITE_FAILED),
                     "Cannot create " + temp.string() + ": " + ec.message());
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::error_code ec(errno, std::generic_category());
            ::close(fd);
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Error(ErrorCode::STORAGE_WRITE_FAILED,
                         "Write to " + temp.string() + " failed: " + ec.message());
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        std::error_code ec(errno, std::generic_category());
        ::close(fd);
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Error(ErrorCode::STORAGE_WRITE_FAILED,
                     "fsync of " + temp.string() + " failed: " + ec.message());
    }
    if (::close(fd) != 0) {
        std::error_code ec(errno, std::generic_category());
        return Error(ErrorCode::STORAGE_WRITE_FAILED,
                     "close of " + temp.string() + " failed: " + ec.message());
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Error(map_io_error(ec, ErrorCode::STORAGE_WRITE_FAILED),
                     "Cannot replace " + path.string() + ": " + ec.message());
    }
    return Ok();
}

Result<void> remove_file(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Error(map_io_error(ec, ErrorCode::STORAGE_DELETE_FAILED),
                     "Cannot delete " + path.string() + ": " + ec.message());
    }
    return Ok();
}

}  // namespace storage
}  // namespace clipstash
