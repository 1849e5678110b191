/* @file ProcessRunner.cpp
 * @brief fork/exec of external helpers with pipe capture, poll-driven deadline and SIGKILL on expiry - POSIX
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring> // for strerror
#include <thread>
#include <vector>

// Linux headers
#include <fcntl.h> // O_CLOEXEC, O_NONBLOCK, open()
#include <poll.h>
#include <signal.h>   // kill()
#include <sys/wait.h> // waitpid()
#include <unistd.h>   // fork(), pipe2(), dup2(), read(), close()

// deskctl headers
#include "io/ProcessRunner.hpp"

extern char** environ;

using namespace deskctl::io;

namespace {

  constexpr std::size_t kMaxCapture = 1 << 20; ///< per stream, rest is discarded

  // RAII pair of pipe ends; closes whatever is still open.
  struct Pipe {
    int rd{ -1 };
    int wr{ -1 };

    ~Pipe() {
      closeRead();
      closeWrite();
    }
    bool open() {
      int fds[2];
      if (::pipe2(fds, O_CLOEXEC) != 0)
        return false;
      rd = fds[0];
      wr = fds[1];
      // only our end is non-blocking, the child keeps blocking writes
      int flags = ::fcntl(rd, F_GETFL);
      return flags >= 0 && ::fcntl(rd, F_SETFL, flags | O_NONBLOCK) == 0;
    }
    void closeRead() {
      if (rd >= 0)
        ::close(rd);
      rd = -1;
    }
    void closeWrite() {
      if (wr >= 0)
        ::close(wr);
      wr = -1;
    }
  };

  std::vector<std::string> buildEnvironment(const std::string& display) {
    std::vector<std::string> env;
    bool hasDisplay = false;
    for (char** e = environ; e && *e; ++e) {
      std::string entry(*e);
      if (entry.starts_with("DISPLAY="))
        hasDisplay = true;
      env.push_back(std::move(entry));
    }
    if (!hasDisplay && !display.empty())
      env.push_back("DISPLAY=" + display);
    return env;
  }

  std::vector<char*> toCArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings)
      out.push_back(s.data());
    out.push_back(nullptr);
    return out;
  }

  // Drains whatever is readable on fd into sink; returns false on EOF or hard error.
  bool drain(int fd, std::string& sink) {
    char buf[4096];
    while (true) {
      ssize_t n = ::read(fd, buf, sizeof(buf));
      if (n > 0) {
        std::size_t room = kMaxCapture > sink.size() ? kMaxCapture - sink.size() : 0;
        sink.append(buf, std::min<std::size_t>(room, static_cast<std::size_t>(n)));
        continue;
      }
      if (n == 0)
        return false; // EOF
      if (errno == EINTR)
        continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK)
        return true; // nothing more for now
      return false;
    }
  }

  int decodeStatus(int status) {
    if (WIFEXITED(status))
      return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
      return 128 + WTERMSIG(status);
    return -1;
  }

} // namespace

ProcessRunner::ProcessRunner(std::string display) : display_(std::move(display)) {}

CommandResult ProcessRunner::run(const CommandSpec& spec) {
  if (spec.argv.empty())
    return CommandResult::failedToSpawn("empty argv");

  Pipe outPipe, errPipe;
  if (!outPipe.open() || !errPipe.open())
    return CommandResult::failedToSpawn(std::string("pipe: ") + strerror(errno));

  // everything the child touches is prepared before fork()
  std::vector<std::string> argvStore = spec.argv;
  std::vector<char*> argv = toCArray(argvStore);
  std::vector<std::string> envStore = buildEnvironment(display_);
  std::vector<char*> envp = toCArray(envStore);

  pid_t pid = ::fork();
  if (pid < 0)
    return CommandResult::failedToSpawn(std::string("fork: ") + strerror(errno));

  if (pid == 0) {
    // child: own process group so a timeout can take down grandchildren too
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    ::dup2(outPipe.wr, STDOUT_FILENO);
    ::dup2(errPipe.wr, STDERR_FILENO);
    ::execvpe(argv[0], argv.data(), envp.data());
    _exit(kExitNotExecutable);
  }

  outPipe.closeWrite();
  errPipe.closeWrite();

  CommandResult result;
  const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
  bool reaped = false;
  int status = 0;

  while (true) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      result.timedOut = true;
      break;
    }
    auto msLeft = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

    std::array<pollfd, 2> pfds{};
    nfds_t count = 0;
    if (outPipe.rd >= 0)
      pfds[count++] = pollfd{ outPipe.rd, POLLIN, 0 };
    if (errPipe.rd >= 0)
      pfds[count++] = pollfd{ errPipe.rd, POLLIN, 0 };

    if (count == 0) {
      // both streams closed, wait for the exit status within the same deadline
      pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid) {
        reaped = true;
        break;
      }
      if (r == -1 && errno != EINTR) {
        result.reason = std::string("waitpid: ") + strerror(errno);
        break;
      }
      std::this_thread::sleep_for(std::min(msLeft, std::chrono::milliseconds{ 5 }));
      continue;
    }

    int rc = ::poll(pfds.data(), count, static_cast<int>(std::max<long long>(1, msLeft.count())));
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      result.reason = std::string("poll: ") + strerror(errno);
      break;
    }
    if (rc == 0)
      continue; // loop re-checks the deadline

    for (nfds_t i = 0; i < count; ++i) {
      if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      if (pfds[i].fd == outPipe.rd && !drain(outPipe.rd, result.out))
        outPipe.closeRead();
      else if (pfds[i].fd == errPipe.rd && !drain(errPipe.rd, result.err))
        errPipe.closeRead();
    }
  }

  if (!reaped) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
  }

  result.exitCode = decodeStatus(status);
  if (result.timedOut)
    result.reason = "timeout after " + std::to_string(spec.timeout.count()) + "ms";
  else if (result.reason.empty() && result.exitCode != 0)
    result.reason = "exit_code:" + std::to_string(result.exitCode);
  return result;
}
