#include "upkit/process.hpp"
#include "upkit/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace upkit {

bool Process::isExecutable(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

bool Process::spawnDetached(const std::filesystem::path& exe,
                            const std::vector<std::string>& args,
                            const std::filesystem::path& cwd,
                            std::string& error) {
    std::vector<std::string> finalArgs;
    finalArgs.push_back(exe.string());
    finalArgs.insert(finalArgs.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (const auto& s : finalArgs)
        argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    // The grandchild reports a failed exec through this pipe; a successful
    // exec closes it (O_CLOEXEC) and the parent reads EOF.
    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) {
        error = std::string("pipe: ") + std::strerror(errno);
        return false;
    }

    pid_t pid = fork();
    if (pid == -1) {
        error = std::string("fork: ") + std::strerror(errno);
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    if (pid == 0) {
        close(pipefd[0]);
        if (setsid() == -1) _exit(127);

        pid_t grandchild = fork();
        if (grandchild != 0) _exit(grandchild == -1 ? 127 : 0);

        int devNull = open("/dev/null", O_RDWR);
        if (devNull != -1) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDOUT_FILENO);
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }

        int err = 0;
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            err = errno;
        } else {
            execv(exe.c_str(), argv.data());
            err = errno;
        }
        ssize_t ignored = write(pipefd[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(pipefd[1]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        close(pipefd[0]);
        error = "Could not detach from launcher process";
        return false;
    }

    int childErr = 0;
    ssize_t n;
    do {
        n = read(pipefd[0], &childErr, sizeof(childErr));
    } while (n == -1 && errno == EINTR);
    close(pipefd[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        error = "Failed to exec " + exe.string() + ": " + std::strerror(childErr);
        return false;
    }
    return true;
}

bool ProcessRelauncher::relaunch(const std::filesystem::path& exe,
                                 const std::vector<std::string>& args,
                                 std::string& error) {
    if (!Process::isExecutable(exe)) {
        error = "Not an executable: " + exe.string();
        return false;
    }
    LOG_INFO("Relaunching " + exe.string());
    return Process::spawnDetached(exe, args, exe.parent_path(), error);
}

} // namespace upkit
