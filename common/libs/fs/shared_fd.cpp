/*
 * Copyright (C) 2017 The Android Open Source Project
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
#include "common/libs/fs/shared_fd.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <algorithm>
#include <vector>

#include <android-base/logging.h>

namespace microguest {

FileInstance::FileInstance(int fd, int in_errno) : fd_(fd), errno_(in_errno) {
  // Ensure every file descriptor managed by a FileInstance has the CLOEXEC
  // flag
  if (fd_ != -1) {
    TEMP_FAILURE_RETRY(fcntl(fd_, F_SETFD, FD_CLOEXEC));
  }
}

bool FileInstance::CopyFrom(FileInstance& in, size_t length) {
  std::vector<char> buffer(1 << 16);
  while (length > 0) {
    ssize_t num_read = in.Read(buffer.data(), std::min(buffer.size(), length));
    if (num_read <= 0) {
      return false;
    }
    length -= num_read;
    ssize_t num_written = 0;
    while (num_written < num_read) {
      ssize_t rval =
          Write(buffer.data() + num_written, num_read - num_written);
      if (rval <= 0) {
        // The caller will have to log an appropriate message.
        return false;
      }
      num_written += rval;
    }
  }
  return true;
}

void FileInstance::Close() {
  if (fd_ == -1) {
    errno_ = EBADF;
  } else if (close(fd_) == -1) {
    errno_ = errno;
    PLOG(DEBUG) << "close(" << fd_ << ") failed";
  }
  fd_ = -1;
}

std::string FileInstance::StrError() const {
  char buffer[160];
  // GNU strerror_r may return a static string instead of using the buffer.
  const char* out = strerror_r(errno_, buffer, sizeof(buffer));
  return std::string(out);
}

SharedFD SharedFD::ErrorFD(int error) {
  return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(-1, error)));
}

SharedFD SharedFD::Dup(int unmanaged_fd) {
  int fd = fcntl(unmanaged_fd, F_DUPFD_CLOEXEC, 3);
  int error_num = errno;
  if (fd == -1) {
    return ErrorFD(error_num);
  }
  return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, 0)));
}

SharedFD SharedFD::Open(const char* path, int flags, mode_t mode) {
  int fd = TEMP_FAILURE_RETRY(open(path, flags | O_CLOEXEC, mode));
  if (fd == -1) {
    return ErrorFD(errno);
  }
  return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, 0)));
}

bool SharedFD::Pipe(SharedFD* fd0, SharedFD* fd1) {
  int fds[2];
  int rval = pipe2(fds, O_CLOEXEC);
  if (rval != -1) {
    (*fd0) = std::shared_ptr<FileInstance>(new FileInstance(fds[0], errno));
    (*fd1) = std::shared_ptr<FileInstance>(new FileInstance(fds[1], errno));
    return true;
  }
  return false;
}

}  // namespace microguest
