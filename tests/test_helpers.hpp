#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <filesystem>
#include <functional>
#include <core/constants.hpp>
#include <devices/resource_manager.hpp>
#include <platform/platform.hpp>

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "mrilabs_test")
        : path_(platform::make_temp_dir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

// Scripted instrument on the far side of a link. Shared between the
// resource manager and every transport opened to it, so tests can pull
// the plug after a device was detected.
struct FakeInstrument {
    std::string identity;
    bool online = true;
    std::vector<std::string> received;
    std::map<std::string, std::string> answers;   // query -> response
};

class FakeTransport : public Transport {
public:
    FakeTransport(std::string resource, std::shared_ptr<FakeInstrument> instrument)
        : resource_(std::move(resource)), instrument_(std::move(instrument)) {}

    void write(const std::string& command) override {
        if (!instrument_->online) throw TransportError("link down: " + resource_);
        instrument_->received.push_back(command);
        last_ = command;
    }

    std::string read() override {
        if (!instrument_->online) throw TransportError("link down: " + resource_);
        if (last_ == IDN_QUERY) return instrument_->identity;
        auto it = instrument_->answers.find(last_);
        return it != instrument_->answers.end() ? it->second : "0";
    }

    const std::string& resource() const override { return resource_; }

private:
    std::string resource_;
    std::shared_ptr<FakeInstrument> instrument_;
    std::string last_;
};

class FakeResourceManager : public ResourceManager {
public:
    std::shared_ptr<FakeInstrument> add(const std::string& resource, const std::string& identity) {
        auto inst = std::make_shared<FakeInstrument>();
        inst->identity = identity;
        order_.push_back(resource);
        instruments_[resource] = inst;
        return inst;
    }

    std::vector<std::string> list_resources() override {
        ++list_calls;
        return order_;
    }

    std::unique_ptr<Transport> open_resource(const std::string& resource) override {
        auto it = instruments_.find(resource);
        if (it == instruments_.end() || !it->second->online) {
            throw TransportError("cannot open " + resource);
        }
        return std::make_unique<FakeTransport>(resource, it->second);
    }

    int list_calls = 0;

private:
    std::vector<std::string> order_;
    std::map<std::string, std::shared_ptr<FakeInstrument>> instruments_;
};
