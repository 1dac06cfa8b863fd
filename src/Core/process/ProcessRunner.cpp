#include "Core/process/ProcessRunner.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <future>
#include <sstream>

namespace bp = boost::process;

namespace {

std::string joinArgs(const std::vector<std::string>& args) {
    std::ostringstream out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i) out << ' ';
        out << args[i];
    }
    return out.str();
}

} // namespace

std::string ProcessRunner::resolve(const std::string& program) {
    if (program.find('/') != std::string::npos) return program;
    return bp::search_path(program).string();
}

ProcessOutput ProcessRunner::run(const std::string& program, const std::vector<std::string>& args) {
    QHLOG_DEBUG("executing: {} {}", program, joinArgs(args));

    const std::string exe = resolve(program);
    if (exe.empty()) {
        throw ProcessLaunchFailure(program + ": executable not found in PATH");
    }

    boost::asio::io_context ios;
    std::future<std::string> out;
    std::future<std::string> err;
    ProcessOutput result;

    try {
        bp::child child(bp::exe = exe, bp::args = args,
                        bp::std_in.close(),
                        bp::std_out > out,
                        bp::std_err > err,
                        ios);
        // Returns once both pipes reach EOF; a daemonizing child detaches its stdio first.
        ios.run();
        child.wait();
        result.exitCode = child.exit_code();
    } catch (const bp::process_error& e) {
        throw ProcessLaunchFailure(program + ": " + e.what());
    }

    result.stdoutText = out.get();
    result.stderrText = err.get();
    QHLOG_DEBUG("STDOUT: {}", result.stdoutText);
    QHLOG_DEBUG("STDERR: {}", result.stderrText);
    return result;
}
