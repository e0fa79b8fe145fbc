#ifndef UPKIT_PROCESS_HPP
#define UPKIT_PROCESS_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace upkit {

class Process {
public:
    static bool isExecutable(const std::filesystem::path& path);

    // Starts `exe` in its own session, fully detached from this process, so
    // it survives our exit. Returns false (with `error` set) when the program
    // could not be executed at all.
    static bool spawnDetached(const std::filesystem::path& exe,
                              const std::vector<std::string>& args,
                              const std::filesystem::path& cwd,
                              std::string& error);
};

// Starts the freshly installed application.
class Relauncher {
public:
    virtual ~Relauncher() = default;
    virtual bool relaunch(const std::filesystem::path& exe,
                          const std::vector<std::string>& args,
                          std::string& error) = 0;
};

class ProcessRelauncher : public Relauncher {
public:
    bool relaunch(const std::filesystem::path& exe,
                  const std::vector<std::string>& args,
                  std::string& error) override;
};

} // namespace upkit

#endif // UPKIT_PROCESS_HPP
