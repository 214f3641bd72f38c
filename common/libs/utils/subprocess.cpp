/*
 * Copyright (C) 2018 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "common/libs/utils/subprocess.h"

#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <deque>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "common/libs/fs/shared_buf.h"
#include "common/libs/utils/files.h"

namespace microguest {
namespace {

constexpr size_t kOutputTailLines = 20;

void DoRedirects(const std::map<Subprocess::StdIOChannel, int>& redirects) {
  for (const auto& entry : redirects) {
    auto std_channel = static_cast<int>(entry.first);
    auto fd = entry.second;
    TEMP_FAILURE_RETRY(dup2(fd, std_channel));
  }
}

std::vector<const char*> ToCharPointers(const std::vector<std::string>& vect) {
  std::vector<const char*> ret = {};
  for (const auto& str : vect) {
    ret.push_back(str.c_str());
  }
  ret.push_back(NULL);
  return ret;
}

}  // namespace

Subprocess::Subprocess(Subprocess&& subprocess)
    : pid_(subprocess.pid_),
      started_(subprocess.started_),
      stopper_(subprocess.stopper_) {
  // Make sure the moved object no longer controls this subprocess
  subprocess.pid_ = -1;
  subprocess.started_ = false;
}

Subprocess& Subprocess::operator=(Subprocess&& other) {
  pid_ = other.pid_;
  started_ = other.started_;
  stopper_ = other.stopper_;

  other.pid_ = -1;
  other.started_ = false;
  return *this;
}

int Subprocess::Wait() {
  if (pid_ < 0) {
    LOG(ERROR)
        << "Attempt to wait on invalid pid(has it been waited on already?): "
        << pid_;
    return -1;
  }
  int wstatus = 0;
  auto pid = pid_;  // Wait will set pid_ to -1 after waiting
  auto wait_ret = Wait(&wstatus, 0);
  if (wait_ret < 0) {
    auto error = errno;
    LOG(ERROR) << "Error on call to waitpid: " << strerror(error);
    return wait_ret;
  }
  int retval = 0;
  if (WIFEXITED(wstatus)) {
    retval = WEXITSTATUS(wstatus);
    if (retval) {
      LOG(DEBUG) << "Subprocess " << pid
                 << " exited with error code: " << retval;
    }
  } else if (WIFSIGNALED(wstatus)) {
    LOG(ERROR) << "Subprocess " << pid
               << " was interrupted by a signal: " << WTERMSIG(wstatus);
    retval = -1;
  }
  return retval;
}

pid_t Subprocess::Wait(int* wstatus, int options) {
  if (pid_ < 0) {
    LOG(ERROR)
        << "Attempt to wait on invalid pid(has it been waited on already?): "
        << pid_;
    return -1;
  }
  auto retval = TEMP_FAILURE_RETRY(waitpid(pid_, wstatus, options));
  // We don't want to wait twice for the same process
  pid_ = -1;
  return retval;
}

StopperResult KillSubprocess(Subprocess* subprocess) {
  auto pid = subprocess->pid();
  if (pid > 0 && kill(pid, SIGKILL) != 0) {
    PLOG(WARNING) << "kill(" << pid << ", SIGKILL) failed";
    return StopperResult::kStopFailure;
  }
  return StopperResult::kStopSuccess;
}

SubprocessOptions& SubprocessOptions::Verbose(bool verbose) & {
  verbose_ = verbose;
  return *this;
}
SubprocessOptions SubprocessOptions::Verbose(bool verbose) && {
  verbose_ = verbose;
  return *this;
}

SubprocessOptions& SubprocessOptions::ExitWithParent(bool v) & {
  exit_with_parent_ = v;
  return *this;
}
SubprocessOptions SubprocessOptions::ExitWithParent(bool v) && {
  exit_with_parent_ = v;
  return *this;
}

Command::Command(std::string executable, SubprocessStopper stopper)
    : subprocess_stopper_(std::move(stopper)) {
  command_.push_back(std::move(executable));
}

Command::~Command() {
  // Close all redirected file descriptors
  for (const auto& entry : redirects_) {
    close(entry.second);
  }
}

Command& Command::RedirectStdIO(Subprocess::StdIOChannel channel,
                                SharedFD shared_fd) & {
  CHECK(shared_fd->IsOpen()) << "Attempted to redirect to closed fd";
  CHECK(redirects_.count(channel) == 0)
      << "Attempted multiple redirections of fd: " << static_cast<int>(channel);
  auto dup_fd = shared_fd->Fcntl(F_DUPFD_CLOEXEC, 3);
  CHECK(dup_fd >= 0) << "Could not acquire a new file descriptor: "
                     << shared_fd->StrError();
  redirects_[channel] = dup_fd;
  return *this;
}
Command Command::RedirectStdIO(Subprocess::StdIOChannel channel,
                               SharedFD shared_fd) && {
  RedirectStdIO(channel, std::move(shared_fd));
  return std::move(*this);
}

std::string Command::ToString() const {
  return android::base::Join(command_, " ");
}

Subprocess Command::Start(SubprocessOptions options) const {
  auto cmd = ToCharPointers(command_);

  pid_t pid = fork();
  if (!pid) {
    if (options.ExitWithParent()) {
      prctl(PR_SET_PDEATHSIG, SIGHUP);  // Die when parent dies
    }

    DoRedirects(redirects_);
    int rval = execv(cmd[0], const_cast<char* const*>(cmd.data()));
    // No need for an if: if exec worked it wouldn't have returned
    LOG(ERROR) << "exec of " << cmd[0] << " failed (" << strerror(errno)
               << ")";
    exit(rval);
  }
  if (pid == -1) {
    LOG(ERROR) << "fork failed (" << strerror(errno) << ")";
  }
  if (options.Verbose()) {
    LOG(DEBUG) << "Started (pid: " << pid << "): " << ToString();
  } else {
    LOG(VERBOSE) << "Started (pid: " << pid << "): " << ToString();
  }
  return Subprocess(pid, subprocess_stopper_);
}

// A class that waits for threads to exit in its destructor.
class ThreadJoiner {
  std::vector<std::thread*> threads_;

 public:
  ThreadJoiner(const std::vector<std::thread*> threads) : threads_(threads) {}
  ~ThreadJoiner() {
    for (auto& thread : threads_) {
      if (thread->joinable()) {
        thread->join();
      }
    }
  }
};

int RunWithManagedStdio(Command&& cmd_tmp, std::string* stdout,
                        std::string* stderr) {
  /*
   * The order of these declarations is necessary for safety. If the function
   * returns at any point, the Command will be destroyed first, closing all of
   * its references to SharedFDs. This will cause the thread internals to fail
   * their reads. The ThreadJoiner then waits for the threads to complete, as
   * running the destructor of an active std::thread crashes the program.
   */
  std::thread stdout_thread, stderr_thread;
  ThreadJoiner thread_joiner({&stdout_thread, &stderr_thread});
  Command cmd = std::move(cmd_tmp);
  bool io_error = false;
  if (stdout != nullptr) {
    SharedFD pipe_read, pipe_write;
    if (!SharedFD::Pipe(&pipe_read, &pipe_write)) {
      LOG(ERROR) << "Could not create a pipe to read the stdout of \""
                 << cmd.Executable() << "\"";
      return -1;
    }
    cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdOut, pipe_write);
    stdout_thread = std::thread([pipe_read, stdout, &io_error]() {
      int read = ReadAll(pipe_read, stdout);
      if (read < 0) {
        io_error = true;
        LOG(ERROR) << "Error in reading stdout from process";
      }
    });
  }
  if (stderr != nullptr) {
    SharedFD pipe_read, pipe_write;
    if (!SharedFD::Pipe(&pipe_read, &pipe_write)) {
      LOG(ERROR) << "Could not create a pipe to read the stderr of \""
                 << cmd.Executable() << "\"";
      return -1;
    }
    cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdErr, pipe_write);
    stderr_thread = std::thread([pipe_read, stderr, &io_error]() {
      int read = ReadAll(pipe_read, stderr);
      if (read < 0) {
        io_error = true;
        LOG(ERROR) << "Error in reading stderr from process";
      }
    });
  }

  auto subprocess = cmd.Start();
  if (!subprocess.Started()) {
    return -1;
  }
  auto cmd_short_name = cmd.Executable();
  {
    // Force the destructor to run by moving it into a smaller scope.
    // This is necessary to close the write end of the pipe.
    Command force_delete = std::move(cmd);
  }
  int wstatus = 0;
  subprocess.Wait(&wstatus, 0);
  if (WIFSIGNALED(wstatus)) {
    LOG(ERROR) << "Command was interrupted by a signal: " << WTERMSIG(wstatus);
    return -1;
  }
  {
    auto join_threads = std::move(thread_joiner);
  }
  if (io_error) {
    LOG(ERROR) << "IO error communicating with " << cmd_short_name;
    return -1;
  }
  return WEXITSTATUS(wstatus);
}

Result<std::string> RunAndCaptureStdout(Command command) {
  const auto command_line = command.ToString();
  std::string standard_out, standard_err;
  int exit_code =
      RunWithManagedStdio(std::move(command), &standard_out, &standard_err);
  MG_EXPECTF(exit_code == 0, "\"{}\" failed with exit code {}: {}",
             command_line, exit_code, standard_err);
  return standard_out;
}

Result<void> RunAndLogOutput(Command command) {
  const auto command_line = command.ToString();
  const auto short_name = cpp_basename(command.Executable());

  SharedFD pipe_read, pipe_write;
  MG_EXPECTF(SharedFD::Pipe(&pipe_read, &pipe_write),
             "Could not create an output pipe for \"{}\"", command_line);
  command.RedirectStdIO(Subprocess::StdIOChannel::kStdOut, pipe_write);
  command.RedirectStdIO(Subprocess::StdIOChannel::kStdErr, pipe_write);

  auto subprocess = command.Start();
  {
    // Releases the duplicated write ends held by the command.
    Command force_delete = std::move(command);
  }
  pipe_write->Close();
  MG_EXPECTF(subprocess.Started(), "Could not start \"{}\"", command_line);

  std::deque<std::string> tail;
  auto emit = [&short_name, &tail](std::string line) {
    LOG(INFO) << short_name << ": " << line;
    tail.emplace_back(std::move(line));
    if (tail.size() > kOutputTailLines) {
      tail.pop_front();
    }
  };
  std::string pending;
  char buffer[4096];
  ssize_t bytes_read = 0;
  while ((bytes_read = pipe_read->Read(buffer, sizeof(buffer))) > 0) {
    pending.append(buffer, bytes_read);
    std::string::size_type newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      emit(pending.substr(0, newline));
      pending.erase(0, newline + 1);
    }
  }
  if (!pending.empty()) {
    emit(pending);
  }
  if (bytes_read < 0) {
    LOG(ERROR) << "Error reading output of \"" << command_line
               << "\": " << pipe_read->StrError();
  }

  int exit_code = subprocess.Wait();
  MG_EXPECTF(exit_code == 0, "\"{}\" failed with exit code {}. Output:\n{}",
             command_line, exit_code,
             android::base::Join(std::vector<std::string>(tail.begin(),
                                                          tail.end()),
                                 "\n"));
  return {};
}

}  // namespace microguest
