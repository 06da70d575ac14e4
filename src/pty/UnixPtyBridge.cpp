/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "UnixPtyBridge.h"

#include <QFile>
#include <QLoggingCategory>
#include <QProcessEnvironment>
#include <QSocketNotifier>
#include <QStandardPaths>
#include <QTimer>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

Q_LOGGING_CATEGORY(lcPty, "tabmux.pty")

namespace Tabmux
{

namespace
{
// Polls spent waiting for a child to exit on its own before its process
// group is killed
constexpr int ReapAttempts = 20;
constexpr int ReapIntervalMs = 5;
constexpr int WriteTimeoutMs = 100;

struct winsize windowSize(int columns, int lines)
{
    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_col = static_cast<unsigned short>(qBound(1, columns, 0xffff));
    ws.ws_row = static_cast<unsigned short>(qBound(1, lines, 0xffff));
    return ws;
}
}

UnixPtyBridge::UnixPtyBridge(const QString &shell, QObject *parent)
    : PtyBridge(parent)
    , _shell(shell)
{
}

UnixPtyBridge::~UnixPtyBridge()
{
    const auto handles = _processes.keys();
    for (ProcessHandle handle : handles) {
        terminate(handle);
    }

    // No event loop to come back to, collect what is left now
    for (auto it = _reaping.constBegin(); it != _reaping.constEnd(); ++it) {
        const pid_t pid = it.key();
        ::kill(-pid, SIGKILL);
        pid_t result;
        do {
            result = waitpid(pid, nullptr, 0);
        } while (result < 0 && errno == EINTR);
    }
}

void UnixPtyBridge::setArguments(const QStringList &arguments)
{
    _arguments = arguments;
}

SpawnResult UnixPtyBridge::createProcess(int columns, int lines)
{
    const QString program = QStandardPaths::findExecutable(_shell);
    if (program.isEmpty()) {
        qCWarning(lcPty) << "cannot spawn, shell not found:" << _shell;
        return SpawnError{QStringLiteral("shell not found: %1").arg(_shell)};
    }

    // Everything the child touches is prepared before fork()
    QList<QByteArray> args;
    args.append(QFile::encodeName(program));
    for (const QString &argument : std::as_const(_arguments)) {
        args.append(argument.toLocal8Bit());
    }
    std::vector<char *> argv;
    for (QByteArray &arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    environment.insert(QStringLiteral("TERM"), QStringLiteral("xterm-256color"));
    QList<QByteArray> envStrings;
    const QStringList entries = environment.toStringList();
    for (const QString &entry : entries) {
        envStrings.append(entry.toLocal8Bit());
    }
    std::vector<char *> envp;
    for (QByteArray &entry : envStrings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    struct winsize ws = windowSize(columns, lines);
    int masterFd = -1;
    const pid_t pid = forkpty(&masterFd, nullptr, nullptr, &ws);
    if (pid < 0) {
        const QString reason = QString::fromLocal8Bit(std::strerror(errno));
        qCWarning(lcPty) << "forkpty failed:" << reason;
        return SpawnError{reason};
    }

    if (pid == 0) {
        execve(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    const int flags = fcntl(masterFd, F_GETFL);
    if (flags != -1) {
        fcntl(masterFd, F_SETFL, flags | O_NONBLOCK);
    }
    fcntl(masterFd, F_SETFD, FD_CLOEXEC);

    const ProcessHandle handle = _nextHandle++;

    Process process;
    process.pid = pid;
    process.masterFd = masterFd;
    process.notifier = new QSocketNotifier(masterFd, QSocketNotifier::Read, this);
    connect(process.notifier, &QSocketNotifier::activated, this, [this, handle]() {
        readAvailable(handle);
    });
    _processes.insert(handle, process);

    qCDebug(lcPty) << "spawned" << program << "pid" << pid << "as handle" << handle << columns << "x" << lines;
    return handle;
}

void UnixPtyBridge::readAvailable(ProcessHandle handle)
{
    auto it = _processes.constFind(handle);
    if (it == _processes.constEnd()) {
        return;
    }
    const int fd = it->masterFd;

    QByteArray data;
    bool finished = false;
    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            data.append(buffer, static_cast<int>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        // EOF, or EIO once every slave descriptor is closed
        finished = true;
        break;
    }

    if (!data.isEmpty()) {
        Q_EMIT outputReceived(handle, data);
    }
    if (finished) {
        finishProcess(handle);
    }
}

void UnixPtyBridge::finishProcess(ProcessHandle handle)
{
    // A receiver of outputReceived() may already have terminated it
    auto it = _processes.find(handle);
    if (it == _processes.end()) {
        return;
    }
    Process process = it.value();
    _processes.erase(it);

    closeProcess(process);

    // The slave side can close a moment before the child is gone
    int exitCode = -1;
    if (!tryReap(process.pid, exitCode)) {
        reapLater(process.pid, handle, true);
        return;
    }

    qCDebug(lcPty) << "handle" << handle << "pid" << process.pid << "exited with" << exitCode;
    Q_EMIT processExited(handle, exitCode);
}

void UnixPtyBridge::write(ProcessHandle handle, const QByteArray &data)
{
    auto it = _processes.constFind(handle);
    if (it == _processes.constEnd()) {
        qCDebug(lcPty) << "write to stale handle" << handle << "dropped";
        return;
    }
    const int fd = it->masterFd;

    qsizetype written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.constData() + written, static_cast<size_t>(data.size() - written));
        if (n >= 0) {
            written += n;
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            if (::poll(&pfd, 1, WriteTimeoutMs) > 0) {
                continue;
            }
        }
        qCWarning(lcPty) << "write to handle" << handle << "failed after" << written << "of" << data.size() << "bytes:" << std::strerror(errno);
        return;
    }
}

void UnixPtyBridge::resize(ProcessHandle handle, int columns, int lines)
{
    auto it = _processes.constFind(handle);
    if (it == _processes.constEnd()) {
        return;
    }

    struct winsize ws = windowSize(columns, lines);
    if (ioctl(it->masterFd, TIOCSWINSZ, &ws) < 0) {
        qCWarning(lcPty) << "resize of handle" << handle << "failed:" << std::strerror(errno);
    }
}

void UnixPtyBridge::terminate(ProcessHandle handle)
{
    auto it = _processes.find(handle);
    if (it == _processes.end()) {
        return;
    }
    Process process = it.value();
    _processes.erase(it);

    closeProcess(process);
    ::kill(process.pid, SIGHUP);

    int exitCode = -1;
    if (!tryReap(process.pid, exitCode)) {
        reapLater(process.pid, handle, false);
        return;
    }
    qCDebug(lcPty) << "terminated handle" << handle << "pid" << process.pid << "status" << exitCode;
}

void UnixPtyBridge::reapLater(pid_t pid, ProcessHandle handle, bool reportExit)
{
    Reaping reaping;
    reaping.handle = handle;
    reaping.reportExit = reportExit;
    _reaping.insert(pid, reaping);

    QTimer::singleShot(ReapIntervalMs, this, [this, pid]() {
        retryReap(pid);
    });
}

void UnixPtyBridge::retryReap(pid_t pid)
{
    auto it = _reaping.find(pid);
    if (it == _reaping.end()) {
        return;
    }

    int exitCode = -1;
    if (tryReap(pid, exitCode)) {
        const Reaping reaping = it.value();
        _reaping.erase(it);
        qCDebug(lcPty) << "reaped handle" << reaping.handle << "pid" << pid << "status" << exitCode;
        if (reaping.reportExit) {
            Q_EMIT processExited(reaping.handle, exitCode);
        }
        return;
    }

    if (++it->attempts == ReapAttempts) {
        // forkpty() made the child a session and group leader
        qCDebug(lcPty) << "pid" << pid << "ignored SIGHUP, killing its process group";
        ::kill(-pid, SIGKILL);
    }

    QTimer::singleShot(ReapIntervalMs, this, [this, pid]() {
        retryReap(pid);
    });
}

bool UnixPtyBridge::isRunning(ProcessHandle handle) const
{
    return _processes.contains(handle);
}

int UnixPtyBridge::processCount() const
{
    return _processes.size();
}

int UnixPtyBridge::pendingReapCount() const
{
    return _reaping.size();
}

void UnixPtyBridge::closeProcess(Process &process)
{
    if (process.notifier) {
        process.notifier->setEnabled(false);
        process.notifier->deleteLater();
        process.notifier = nullptr;
    }
    if (process.masterFd >= 0) {
        ::close(process.masterFd);
        process.masterFd = -1;
    }
}

bool UnixPtyBridge::tryReap(pid_t pid, int &exitCode)
{
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return false;
    }
    // ECHILD: somebody else collected it, nothing left to wait for
    exitCode = result == pid ? exitCodeFromStatus(status) : -1;
    return true;
}

int UnixPtyBridge::exitCodeFromStatus(int status)
{
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace Tabmux

#include "moc_UnixPtyBridge.cpp"
