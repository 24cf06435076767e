#include "test_support.hpp"

#include <thread>

#include <boost/asio/error.hpp>

namespace lanwatch::testing {

TempDir::TempDir(const std::string& prefix) {
    static std::atomic<std::size_t> counter{0};
    const auto suffix = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "-" +
                        std::to_string(counter++);
    path_ = std::filesystem::temp_directory_path() / (prefix + "-" + suffix);
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

control::DiscoveredHost host(const std::string& address, const std::string& hardware_id) {
    return control::DiscoveredHost{.address = address, .hardware_id = hardware_id, .name = std::nullopt};
}

void FakeDiscovery::push(std::vector<control::DiscoveredHost> hosts) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(Step{std::move(hosts), {}});
}

void FakeDiscovery::push_error(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(Step{{}, std::move(message)});
}

void FakeDiscovery::hold() {
    std::lock_guard<std::mutex> lock(mutex_);
    held_ = true;
}

void FakeDiscovery::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = false;
    }
    released_.notify_all();
}

control::DiscoveryResult FakeDiscovery::discover(const control::Subnet&, std::chrono::milliseconds, int) {
    ++calls_;
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [this] { return !held_; });

    if (!script_.empty()) {
        last_ = std::move(script_.front());
        script_.pop_front();
    }
    if (!last_.error.empty()) {
        auto message = last_.error;
        // Errors are one-shot; the following cycle scans nothing.
        last_ = Step{};
        throw control::DiscoveryError(message);
    }
    return control::DiscoveryResult{last_.hosts, "fake"};
}

FakeObserver::FakeObserver(std::string name, Mode mode) : name_(std::move(name)), mode_(mode) {}

void FakeObserver::deliver(std::shared_ptr<const std::string> payload, DeliveryHandler on_complete) {
    const auto mode = mode_.load();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(nlohmann::json::parse(*payload));
        if (mode == Mode::Unresponsive) {
            parked_.push_back(std::move(on_complete));
            return;
        }
    }
    if (mode == Mode::Failing) {
        on_complete(boost::asio::error::broken_pipe);
        return;
    }
    on_complete({});
}

std::vector<nlohmann::json> FakeObserver::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::vector<std::string> FakeObserver::types() const {
    std::vector<std::string> result;
    for (const auto& message : messages()) {
        result.push_back(message.value("type", ""));
    }
    return result;
}

std::size_t FakeObserver::count_of(const std::string& type) const {
    std::size_t count = 0;
    for (const auto& name : types()) {
        if (name == type) {
            ++count;
        }
    }
    return count;
}

control::ScanSettings scan_settings(std::chrono::seconds interval) {
    control::ScanSettings scan;
    scan.interval = interval;
    scan.grace_limit = 3;
    scan.timeout = std::chrono::milliseconds(1000);
    scan.retries = 0;
    return scan;
}

LoopFixture::LoopFixture(std::chrono::seconds interval)
    : dir("lanwatch-loop"),
      store(dir.path()),
      work(boost::asio::make_work_guard(io_context)),
      hub(io_context, std::chrono::milliseconds(500), 16),
      interval(interval) {
    store.load();
}

LoopFixture::~LoopFixture() {
    shutdown();
    loop.reset();
}

control::ScanLoop& LoopFixture::make_loop() {
    loop = std::make_unique<control::ScanLoop>(io_context, discovery, store, hub,
                                               control::Subnet::parse("192.168.1.0/24"), scan_settings(interval));
    hub.set_snapshot_source([this] { return loop->snapshot(); });
    return *loop;
}

void LoopFixture::start() {
    if (!loop) {
        make_loop();
    }
    runner = std::thread([this] { io_context.run(); });
    loop->start();
}

void LoopFixture::shutdown() {
    discovery.release();
    if (loop) {
        loop->stop();
    }
    work.reset();
    io_context.stop();
    if (runner.joinable()) {
        runner.join();
    }
}

bool LoopFixture::wait_for_cycles(std::uint64_t cycles) {
    return wait_until([&] { return loop->cycles_completed() >= cycles; });
}

}  // namespace lanwatch::testing
