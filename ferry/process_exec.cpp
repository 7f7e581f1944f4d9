// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "process_exec.h"
#include <chrono>
#include "guid.h"
#include "file_access.h"

    #include <csignal>    //kill
    #include <unistd.h>   //fork, pipe
    #include <sys/wait.h> //waitpid
    #include <sys/select.h>
    #include <fcntl.h>

using namespace ferry;


namespace
{
const int EC_CHILD_LAUNCH_FAILED = 120; //avoid 127: used by the system, e.g. failure to execute due to missing .so file


//buffer child output in temporary file: pipes would need a reader thread to not block the child
int createUnlinkedTempFile() //throw SysError
{
    std::string tempFilePath;
    try
    {
        tempFilePath = appendPath(getTempFolderPath(), "FileFerry-" + formatAsHexString(generateGUID())); //throw FileError
    }
    catch (const FileError& e) { throw SysError(replaceCpy(e.toString(), L"\n\n", L"\n")); }

    const int fdTempFile = ::open(tempFilePath.c_str(), O_CREAT | O_EXCL | O_RDWR | O_CLOEXEC,
                                  S_IRUSR | S_IWUSR); //0600
    if (fdTempFile == -1)
        THROW_LAST_SYS_ERROR("open(" + tempFilePath + ")");
    FERRY_ON_SCOPE_FAIL(::close(fdTempFile));

    //"deleting while handle is open" == FILE_FLAG_DELETE_ON_CLOSE
    if (::unlink(tempFilePath.c_str()) != 0)
        THROW_LAST_SYS_ERROR("unlink");

    return fdTempFile;
}


std::string readTempFile(int fd) //throw SysError
{
    if (::lseek(fd, 0, SEEK_SET) != 0)
        THROW_LAST_SYS_ERROR("lseek");

    std::string output;
    char buffer[64 * 1024];
    for (;;)
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(fd, buffer, sizeof(buffer));
        }
        while (bytesRead < 0 && errno == EINTR);

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");
        if (bytesRead == 0) //EOF
            return output;

        output.append(buffer, bytesRead);
    }
}


void waitForChild(pid_t pid, int& statusCode) //throw SysError
{
    for (;;)
        if (::waitpid(pid, &statusCode, 0) == pid)
            return;
        else if (errno != EINTR)
            THROW_LAST_SYS_ERROR("waitpid");
}


//wait until all holders of the life sign pipe are gone => false on time out
bool waitForLifeSignEof(int fdLifeSignR, int timeoutMs) //throw SysError
{
    const int flags = ::fcntl(fdLifeSignR, F_GETFL);
    if (flags == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_GETFL)");

    if (::fcntl(fdLifeSignR, F_SETFL, flags | O_NONBLOCK) == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_SETFL, O_NONBLOCK)");

    const auto stopTime = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    for (;;)
    {
        //read until EAGAIN
        char buf[16];
        const ssize_t bytesRead = ::read(fdLifeSignR, buf, sizeof(buf));
        if (bytesRead < 0)
        {
            if (errno != EAGAIN && errno != EINTR)
                THROW_LAST_SYS_ERROR("read");
        }
        else if (bytesRead > 0)
            throw SysError(formatSystemError("read", L"", L"Unexpected data."));
        else //bytesRead == 0: EOF
            return true;

        const auto now = std::chrono::steady_clock::now();
        if (now > stopTime)
            return false;

        const auto waitTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(stopTime - now).count();

        timeval tv{.tv_sec = static_cast<long>(waitTimeMs / 1000)};
        tv.tv_usec = static_cast<long>(waitTimeMs - tv.tv_sec * 1000) * 1000;

        fd_set rfd{}; //includes FD_ZERO
        FD_SET(fdLifeSignR, &rfd);

        if (const int rv = ::select(fdLifeSignR + 1, &rfd, nullptr, nullptr, &tv);
            rv < 0)
        {
            if (errno != EINTR)
                THROW_LAST_SYS_ERROR("select");
        }
        else if (rv == 0)
            return false;
    }
}
}


ProcessResult ferry::processExecute(const std::vector<std::string>& argv, const ProcessStreams& streams,
                                    std::optional<int> timeoutMs) //throw SysError, SysErrorTimeOut
{
    if (argv.empty() || argv[0].empty())
        throw SysError(L"Contract error: no command specified.");

    //open all files in the parent process => better error reporting
    const int fdStdIn = ::open(streams.stdinFilePath ? streams.stdinFilePath->c_str() : "/dev/null", O_RDONLY | O_CLOEXEC);
    if (fdStdIn == -1)
        THROW_LAST_SYS_ERROR("open(" + (streams.stdinFilePath ? *streams.stdinFilePath : std::string("/dev/null")) + ")");
    FERRY_ON_SCOPE_EXIT(::close(fdStdIn));

    const int fdStdOut = streams.stdoutFilePath ?
                         ::open(streams.stdoutFilePath->c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, S_IRUSR | S_IWUSR) :
                         createUnlinkedTempFile(); //throw SysError
    if (fdStdOut == -1)
        THROW_LAST_SYS_ERROR("open(" + *streams.stdoutFilePath + ")");
    FERRY_ON_SCOPE_EXIT(::close(fdStdOut));

    const int fdStdErr = createUnlinkedTempFile(); //throw SysError
    FERRY_ON_SCOPE_EXIT(::close(fdStdErr));

    //--------------------------------------------------------------
    //waitpid() has no time out => check EOF from dummy pipe instead
    int pipe[2] = {};
    if (::pipe2(pipe, O_CLOEXEC) != 0)
        THROW_LAST_SYS_ERROR("pipe2");

    const int fdLifeSignR = pipe[0]; //for parent process
    const int fdLifeSignW = pipe[1]; //for child process
    FERRY_ON_SCOPE_EXIT(::close(fdLifeSignR));
    auto guardFdLifeSignW = makeGuard<ScopeGuardRunMode::onExit>([&] { ::close(fdLifeSignW); });

    //prepare argv before fork(): no allocations in the child
    std::vector<const char*> argvRaw;
    for (const std::string& arg : argv)
        argvRaw.push_back(arg.c_str());
    argvRaw.push_back(nullptr);

    const std::string execvpError = "execvp(" + argv[0] + ")";
    //--------------------------------------------------------------

    const pid_t pid = ::fork();
    if (pid < 0)
        THROW_LAST_SYS_ERROR("fork");

    if (pid == 0) //child process
        try
        {
            //first task: set STDERR redirection in case an error needs to be reported
            if (::dup2(fdStdErr, STDERR_FILENO) != STDERR_FILENO) //O_CLOEXEC does NOT propagate with dup2()
                THROW_LAST_SYS_ERROR("dup2(STDERR)");

            if (::dup2(fdStdOut, STDOUT_FILENO) != STDOUT_FILENO)
                THROW_LAST_SYS_ERROR("dup2(STDOUT)");

            if (::dup2(fdStdIn, STDIN_FILENO) != STDIN_FILENO)
                THROW_LAST_SYS_ERROR("dup2(STDIN)");

            if (timeoutMs) //own process group => whole tree can be killed on time out
                if (::setpgid(0, 0) != 0)
                    THROW_LAST_SYS_ERROR("setpgid");

            //*leak* the fd and have it closed automatically on child process exit after execvp()
            if (::dup(fdLifeSignW) == -1) //O_CLOEXEC does NOT propagate with dup()
                THROW_LAST_SYS_ERROR("dup(fdLifeSignW)");

            ::execvp(argvRaw[0], const_cast<char**>(argvRaw.data())); //only returns if an error occurred
            //safe to cast away const: https://pubs.opengroup.org/onlinepubs/9699919799/functions/exec.html
            THROW_LAST_SYS_ERROR(execvpError);
        }
        catch (const SysError& e)
        {
            const std::string msg = utfTo<std::string>(e.toString()) + '\n';
            [[maybe_unused]] const ssize_t rv = ::write(STDERR_FILENO, msg.c_str(), msg.size()); //nothing left to report to
            ::_exit(EC_CHILD_LAUNCH_FAILED); //[!] avoid flushing I/O buffers or doing other clean up from child process like with "exit()"!
        }
    //else: parent process

    int statusCode = 0;
    if (timeoutMs)
    {
        guardFdLifeSignW.dismiss();
        ::close(fdLifeSignW); //[!] make sure we get EOF when fd is closed by child!

        bool finished = false;
        try
        {
            finished = waitForLifeSignEof(fdLifeSignR, *timeoutMs); //throw SysError
        }
        catch (const SysError&) //don't leave the child behind
        {
            if (::kill(-pid, SIGKILL) != 0 && ::kill(pid, SIGKILL) != 0)
                logExtraError(formatSystemError("kill", getLastError()));
            try { waitForChild(pid, statusCode); } //throw SysError
            catch (const SysError& e2) { logExtraError(e2.toString()); }
            throw;
        }

        if (!finished)
        {
            if (::kill(-pid, SIGKILL) != 0)
                if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) //setpgid() may not have run yet
                    THROW_LAST_SYS_ERROR("kill");

            waitForChild(pid, statusCode); //throw SysError => no zombies

            throw SysErrorTimeOut(replaceCpy(L"Operation timed out after %x ms.", L"%x", numberTo<std::wstring>(*timeoutMs)) +
                                  [&] { std::wstring err = trimCpy(utfTo<std::wstring>(readTempFile(fdStdErr))); return err.empty() ? L"" : L'\n' + err; }());
        }
    }

    waitForChild(pid, statusCode); //throw SysError

    ProcessResult result;
    result.stdErr = readTempFile(fdStdErr); //throw SysError
    if (!streams.stdoutFilePath)
        result.stdOut = readTempFile(fdStdOut); //throw SysError

    if (!WIFEXITED(statusCode)) //signalled, crashed?
        throw SysError(formatSystemError("waitpid", WIFSIGNALED(statusCode) ?
                                         L"Killed by signal " + numberTo<std::wstring>(WTERMSIG(statusCode)) :
                                         L"Exit status "      + numberTo<std::wstring>(statusCode),
                                         utfTo<std::wstring>(trimCpy(result.stdErr))));

    result.exitCode = WEXITSTATUS(statusCode); //precondition: "WIFEXITED() == true"
    if (result.exitCode == EC_CHILD_LAUNCH_FAILED) //child process should already have provided details to STDERR
        throw SysError(utfTo<std::wstring>(trimCpy(result.stdErr)));

    return result;
}
