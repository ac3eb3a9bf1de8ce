#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <fstream>
#include <system_error>
#include <thread>
#include "common/defer.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
    fout << content;
}

static void write_all(int fd, const string &content, const fs::path &path) {
    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "unable to write file " + path.string());
        }
        written += n;
    }
}

void write_file_atomic(const fs::path &path, const string &content) {
    fs::create_directories(path.parent_path());
    fs::path temp = path.parent_path() /
                    ("." + path.filename().string() + "." + boost::uuids::to_string(boost::uuids::random_generator()()) + ".tmp");

    int fd = open(temp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to create temporary file " + temp.string());

    bool committed = false;
    defer {
        if (!committed) {
            error_code ec;
            fs::remove(temp, ec);
        }
    };

    {
        defer { close(fd); };
        write_all(fd, content, temp);
        if (fsync(fd) != 0)
            throw system_error(errno, system_category(), "unable to sync file " + temp.string());
    }

    if (rename(temp.c_str(), path.c_str()) != 0)
        throw system_error(errno, system_category(), "unable to replace file " + path.string());
    committed = true;

    // rename 之后同步目录项，保证掉电后能看到新文件
    int dirfd = open(path.parent_path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirfd >= 0) {
        fsync(dirfd);
        close(dirfd);
    }
}

string assert_safe_path(const string &subpath) {
    fs::path p(subpath);
    if (subpath.empty() || p.is_absolute())
        throw invalid_argument("subpath is not safe " + subpath);
    for (auto &part : p)
        if (part == "..")
            throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

vector<fs::path> list_files(const fs::path &dir) {
    vector<fs::path> files;
    if (!fs::is_directory(dir)) return files;
    for (auto &entry : fs::recursive_directory_iterator(dir))
        if (entry.is_regular_file())
            files.push_back(fs::relative(entry.path(), dir));
    sort(files.begin(), files.end());
    return files;
}

void copy_directory(const fs::path &from, const fs::path &to) {
    fs::create_directories(to);
    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    // 只读的 starter/tests 复制后要能被学生程序或者下一次复制覆盖
    make_writable(to);
}

void make_read_only(const fs::path &dir) {
    if (!fs::exists(dir)) return;
    auto strip = fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write;
    for (auto &entry : fs::recursive_directory_iterator(dir))
        if (entry.is_regular_file())
            fs::permissions(entry.path(), strip, fs::perm_options::remove);
}

void make_writable(const fs::path &dir) {
    if (!fs::exists(dir)) return;
    for (auto &entry : fs::recursive_directory_iterator(dir))
        if (entry.is_regular_file())
            fs::permissions(entry.path(), fs::perms::owner_write, fs::perm_options::add);
}

scoped_file_lock::scoped_file_lock() {
    valid = false;
}

scoped_file_lock::scoped_file_lock(scoped_file_lock &&lock) {
    *this = move(lock);
}

scoped_file_lock::~scoped_file_lock() {
    release();
}

scoped_file_lock &scoped_file_lock::operator=(scoped_file_lock &&lock) {
    swap(fd, lock.fd);
    swap(valid, lock.valid);
    swap(lock_file, lock.lock_file);
    return *this;
}

optional<scoped_file_lock> scoped_file_lock::try_lock(const fs::path &path, bool shared, chrono::milliseconds timeout) {
    int fd = open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to open lock file " + path.string());

    auto deadline = chrono::steady_clock::now() + timeout;
    while (flock(fd, (shared ? LOCK_SH : LOCK_EX) | LOCK_NB) != 0) {
        if (errno != EWOULDBLOCK && errno != EINTR) {
            int err = errno;
            close(fd);
            throw system_error(err, system_category(), "unable to lock " + path.string());
        }
        if (chrono::steady_clock::now() >= deadline) {
            close(fd);
            return {};
        }
        this_thread::sleep_for(chrono::milliseconds(10));
    }

    scoped_file_lock lock;
    lock.fd = fd;
    lock.valid = true;
    lock.lock_file = path;
    return optional<scoped_file_lock>(move(lock));
}

void scoped_file_lock::release() {
    if (!valid) return;
    flock(fd, LOCK_UN);
    close(fd);
    valid = false;
}

static fs::path prepare_lock_file(const fs::path &dir) {
    fs::create_directories(dir);
    fs::path lock_file = dir / ".lock";
    if (fs::is_directory(lock_file))
        fs::remove_all(lock_file);
    return lock_file;
}

optional<scoped_file_lock> lock_directory(const fs::path &dir, bool shared, chrono::milliseconds timeout) {
    return scoped_file_lock::try_lock(prepare_lock_file(dir), shared, timeout);
}

}  // namespace grader
