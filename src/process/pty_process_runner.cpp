#include "process/pty_process_runner.hpp"

#include <array>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/write.hpp>
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <boost/process/posix.hpp>

#include "runner/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace abstruse::process {
namespace bp = boost::process;

namespace {

constexpr unsigned short kPtyColumns = 80;
constexpr unsigned short kPtyRows = 30;

struct PtyPair {
    int master_fd = -1;
    int slave_fd = -1;
};

void ClosePtyPair(PtyPair& pair) {
    if (pair.master_fd >= 0) {
        ::close(pair.master_fd);
        pair.master_fd = -1;
    }
    if (pair.slave_fd >= 0) {
        ::close(pair.slave_fd);
        pair.slave_fd = -1;
    }
}

PtyPair AllocatePty() {
    PtyPair pair;
    pair.master_fd = ::posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (pair.master_fd == -1) {
        throw runner::SpawnError(std::string("posix_openpt failed: ") + std::strerror(errno));
    }
    if (::grantpt(pair.master_fd) != 0) {
        const std::string reason = std::strerror(errno);
        ClosePtyPair(pair);
        throw runner::SpawnError("grantpt failed: " + reason);
    }
    if (::unlockpt(pair.master_fd) != 0) {
        const std::string reason = std::strerror(errno);
        ClosePtyPair(pair);
        throw runner::SpawnError("unlockpt failed: " + reason);
    }
    char slave_name[PATH_MAX];
    if (::ptsname_r(pair.master_fd, slave_name, sizeof(slave_name)) != 0) {
        const std::string reason = std::strerror(errno);
        ClosePtyPair(pair);
        throw runner::SpawnError("ptsname_r failed: " + reason);
    }
    pair.slave_fd = ::open(slave_name, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (pair.slave_fd == -1) {
        const std::string reason = std::strerror(errno);
        ClosePtyPair(pair);
        throw runner::SpawnError("open slave pty failed: " + reason);
    }

    struct winsize size {};
    size.ws_col = kPtyColumns;
    size.ws_row = kPtyRows;
    ::ioctl(pair.master_fd, TIOCSWINSZ, &size);
    return pair;
}

boost::filesystem::path ResolveBinary(const std::string& binary) {
    if (binary.find('/') != std::string::npos) {
        return boost::filesystem::path(binary);
    }
    auto path = bp::search_path(binary);
    if (path.empty()) {
        throw runner::SpawnError("container runtime '" + binary + "' not found on PATH");
    }
    return path;
}

class PtyChannel : public ControlChannel, public std::enable_shared_from_this<PtyChannel> {
public:
    PtyChannel(boost::asio::io_context& io, int master_fd)
        : io_(io)
        , master_(io, master_fd) {}

    void Launch(const boost::filesystem::path& exe, const std::vector<std::string>& args, int slave_fd) {
        auto self = shared_from_this();
        std::error_code ec;
        child_ = bp::child(
            exe,
            bp::args = args,
            bp::posix::fd.bind(STDIN_FILENO, slave_fd),
            bp::posix::fd.bind(STDOUT_FILENO, slave_fd),
            bp::posix::fd.bind(STDERR_FILENO, slave_fd),
            bp::extend::on_exec_setup([](auto&) {
                ::setsid();
                ::ioctl(STDIN_FILENO, TIOCSCTTY, 0);
            }),
            io_,
            bp::on_exit([self](int exit_code, const std::error_code&) {
                self->HandleExit(exit_code);
            }),
            ec);
        if (ec) {
            throw runner::SpawnError("failed to launch " + exe.string() + ": " + ec.message());
        }
        ReadSome();
    }

    void Write(const std::string& data) override {
        boost::system::error_code ec;
        boost::asio::write(master_, boost::asio::buffer(data), ec);
        if (ec) {
            utils::LogWarn("pty", "write failed: " + ec.message());
        }
    }

    void OnData(DataHandler handler) override {
        on_data_ = std::move(handler);
    }

    void OnExit(ExitHandler handler) override {
        on_exit_ = std::move(handler);
    }

    void Kill() override {
        if (exited_ || !child_.valid()) {
            return;
        }
        // setsid() in the child made its pid the process group id.
        if (::kill(-child_.id(), SIGKILL) != 0 && errno != ESRCH) {
            utils::LogWarn("pty", std::string("kill failed: ") + std::strerror(errno));
        }
    }

private:
    void ReadSome() {
        auto self = shared_from_this();
        master_.async_read_some(
            boost::asio::buffer(buffer_),
            [self](const boost::system::error_code& ec, std::size_t bytes) {
                if (bytes > 0 && self->on_data_) {
                    auto handler = self->on_data_;
                    handler(std::string(self->buffer_.data(), bytes));
                }
                if (ec) {
                    // EIO once every slave descriptor is closed.
                    self->drained_ = true;
                    self->MaybeReportExit();
                    return;
                }
                self->ReadSome();
            });
    }

    void HandleExit(int exit_code) {
        exited_ = true;
        exit_code_ = exit_code;
        MaybeReportExit();
    }

    // Exit is reported after the last output chunk.
    void MaybeReportExit() {
        if (!exited_ || !drained_ || reported_) {
            return;
        }
        reported_ = true;
        if (on_exit_) {
            auto handler = on_exit_;
            handler(exit_code_);
        }
    }

    boost::asio::io_context& io_;
    boost::asio::posix::stream_descriptor master_;
    std::array<char, 4096> buffer_{};
    bp::child child_;
    DataHandler on_data_;
    ExitHandler on_exit_;
    bool exited_ = false;
    bool drained_ = false;
    bool reported_ = false;
    int exit_code_ = 0;
};

}  // namespace

PtyProcessRunner::PtyProcessRunner(boost::asio::io_context& io, std::string runtime_binary)
    : io_(io)
    , runtime_binary_(std::move(runtime_binary)) {}

std::shared_ptr<ControlChannel> PtyProcessRunner::Spawn(const std::vector<std::string>& args) {
    const auto exe = ResolveBinary(runtime_binary_);
    auto pty = AllocatePty();
    utils::LogDebug("pty", runtime_binary_ + " " + utils::Join(args, " "));

    std::shared_ptr<PtyChannel> channel;
    try {
        channel = std::make_shared<PtyChannel>(io_, pty.master_fd);
        pty.master_fd = -1;
        channel->Launch(exe, args, pty.slave_fd);
    } catch (const std::exception&) {
        ClosePtyPair(pty);
        throw;
    }
    // The child holds its own copy; keeping ours would hide EIO on the master.
    ClosePtyPair(pty);
    return channel;
}

}  // namespace abstruse::process
