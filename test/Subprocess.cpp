// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "test/Subprocess.hpp"

#include <cerrno>
#include <csignal>

#include <sys/wait.h>
#include <unistd.h>

namespace quotemeta {
namespace test {

namespace {

bool WriteAll(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            // The program exited without reading all of its input.
            return errno == EPIPE;
        }
        data.remove_prefix(n);
    }
    return true;
}

} // namespace

int RunProgram(const std::string &program,
               const std::vector<std::string> &args, std::string_view input,
               std::string *out) {
    int in[2], outp[2];
    if (pipe(in) != 0) {
        return -1;
    }
    if (pipe(outp) != 0) {
        close(in[0]);
        close(in[1]);
        return -1;
    }
    std::vector<char *> argv;
    std::string arg0 = program;
    argv.push_back(arg0.data());
    std::vector<std::string> copy = args;
    for (std::string &arg : copy) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        close(in[0]);
        close(in[1]);
        close(outp[0]);
        close(outp[1]);
        return -1;
    }
    if (pid == 0) {
        dup2(in[0], STDIN_FILENO);
        dup2(outp[1], STDOUT_FILENO);
        close(in[0]);
        close(in[1]);
        close(outp[0]);
        close(outp[1]);
        execv(program.c_str(), argv.data());
        _exit(127);
    }
    close(in[0]);
    close(outp[1]);
    // A child which exits without reading its input must not kill the test.
    std::signal(SIGPIPE, SIG_IGN);
    bool ok = WriteAll(in[1], input);
    close(in[1]);
    char buf[4096];
    while (true) {
        ssize_t n = read(outp[0], buf, sizeof(buf));
        if (n > 0) {
            out->append(buf, n);
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    close(outp[0]);
    int status;
    if (waitpid(pid, &status, 0) != pid || !ok || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

} // namespace test
} // namespace quotemeta
