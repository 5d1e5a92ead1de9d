#include "proc/ProcUtil.hpp"

#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace procutil {

std::string quote_windows_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) return arg;

    std::string out = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            out.append(backslashes * 2 + 1, '\\');
        } else {
            out.append(backslashes, '\\');
        }
        backslashes = 0;
        out += c;
    }
    // backslashes before the closing quote must be doubled
    out.append(backslashes * 2, '\\');
    out += '"';
    return out;
}

#ifdef _WIN32

namespace {

class HandleGuard {
    HANDLE h_ = NULL;

public:
    HandleGuard() = default;
    explicit HandleGuard(HANDLE h) : h_(h) {}
    ~HandleGuard() { reset(); }

    HandleGuard(const HandleGuard&) = delete;
    HandleGuard& operator=(const HandleGuard&) = delete;

    HANDLE get() const { return h_; }
    HANDLE* put() { reset(); return &h_; }

    void reset() {
        if (h_ != NULL && h_ != INVALID_HANDLE_VALUE) CloseHandle(h_);
        h_ = NULL;
    }
};

std::system_error last_error(const std::string& what) {
    return std::system_error(static_cast<int>(GetLastError()), std::system_category(), what);
}

} // namespace

ProcResult run_capture(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::invalid_argument("run_capture: empty argv");

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = NULL;

    HandleGuard readPipe;
    HandleGuard writePipe;
    if (!CreatePipe(readPipe.put(), writePipe.put(), &sa, 0)) {
        throw last_error("CreatePipe failed");
    }

    // Ensure the read end is not inherited
    SetHandleInformation(readPipe.get(), HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput  = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = writePipe.get();
    si.hStdError  = GetStdHandle(STD_ERROR_HANDLE);

    std::string cmdline;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) cmdline += ' ';
        cmdline += quote_windows_arg(argv[i]);
    }

    PROCESS_INFORMATION pi{};
    BOOL ok = CreateProcessA(
        NULL,
        cmdline.data(),
        NULL,
        NULL,
        TRUE,
        CREATE_NO_WINDOW,
        NULL,
        NULL,
        &si,
        &pi
    );
    if (!ok) throw last_error("failed to execute " + argv[0]);

    HandleGuard process(pi.hProcess);
    HandleGuard thread(pi.hThread);

    // Parent no longer needs write end
    writePipe.reset();

    ProcResult res;
    res.out.reserve(8192);

    char buf[4096];
    DWORD n = 0;
    while (true) {
        BOOL r = ReadFile(readPipe.get(), buf, sizeof(buf), &n, NULL);
        if (!r) {
            if (GetLastError() == ERROR_BROKEN_PIPE) break;
            throw last_error("reading output of " + argv[0] + " failed");
        }
        if (n == 0) break;
        res.out.append(buf, buf + n);
    }

    WaitForSingleObject(process.get(), INFINITE);

    DWORD code = 0;
    if (!GetExitCodeProcess(process.get(), &code)) throw last_error("GetExitCodeProcess failed");
    res.exit_code = static_cast<int>(code);
    return res;
}

#else

namespace {

class FdGuard {
    int fd_ = -1;

public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }
};

struct Pipe {
    FdGuard read_end;
    FdGuard write_end;
};

void make_pipe(Pipe& p) {
    int fds[2];
    if (::pipe(fds) != 0) throw std::system_error(errno, std::generic_category(), "pipe failed");
    p.read_end.reset(fds[0]);
    p.write_end.reset(fds[1]);
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
}

ssize_t read_retry(int fd, void* buf, size_t len) {
    ssize_t n;
    do {
        n = ::read(fd, buf, len);
    } while (n < 0 && errno == EINTR);
    return n;
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

ProcResult run_capture(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::invalid_argument("run_capture: empty argv");

    // everything the child touches is prepared before fork
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    Pipe out;
    Pipe status;  // carries errno from a failed exec; closed by a successful one
    make_pipe(out);
    make_pipe(status);

    const pid_t pid = ::fork();
    if (pid < 0) throw std::system_error(errno, std::generic_category(), "fork failed");

    if (pid == 0) {
        // child: async-signal-safe calls only
        if (::dup2(out.write_end.get(), STDOUT_FILENO) < 0) {
            int e = errno;
            (void)!::write(status.write_end.get(), &e, sizeof(e));
            ::_exit(127);
        }
        ::execvp(cargv[0], cargv.data());
        int e = errno;
        (void)!::write(status.write_end.get(), &e, sizeof(e));
        ::_exit(127);
    }

    out.write_end.reset();
    status.write_end.reset();

    ProcResult res;
    res.out.reserve(8192);

    int read_errno = 0;
    char buf[4096];
    while (true) {
        const ssize_t n = read_retry(out.read_end.get(), buf, sizeof(buf));
        if (n < 0) {
            read_errno = errno;
            break;
        }
        if (n == 0) break;
        res.out.append(buf, static_cast<size_t>(n));
    }
    out.read_end.reset();

    int child_errno = 0;
    const ssize_t got = read_retry(status.read_end.get(), &child_errno, sizeof(child_errno));

    // always reap the child, even when reporting an error
    res.exit_code = wait_child(pid);

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        throw std::system_error(child_errno, std::generic_category(), "failed to execute " + argv[0]);
    }
    if (read_errno != 0) {
        throw std::system_error(read_errno, std::generic_category(), "reading output of " + argv[0] + " failed");
    }
    return res;
}

#endif

} // namespace procutil
