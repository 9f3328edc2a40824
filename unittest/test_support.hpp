#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>
#include <gtest/gtest.h>
#include "transfer_client.hpp"

namespace fs = std::filesystem;

// Scratch directory removed at the end of each test.
class TempDir {
public:
    TempDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("presetdeploy_") + (info ? info->test_suite_name() : "suite") + "_"
                           + (info ? info->name() : "test") + "_" + std::to_string(::getpid());
        path_ = fs::temp_directory_path() / name;
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

// In-memory server shared by FakeTransferClient and its sessions.
struct FakeRemote {
    std::map<std::string, std::string> files;
    std::vector<std::string> calls;
    std::set<std::string> failDownload;            // download fails with a Transfer error
    std::map<std::string, int> failUploads;        // next N uploads write "PARTIAL" then fail
    std::set<std::string> corruptUpload;           // upload stores altered bytes
    std::map<std::string, int> throwOnUpload;      // next N uploads write "PARTIAL" then throw
    std::set<std::string> throwForeignOnUpload;    // upload throws a type not derived from std::exception
    std::function<void(const std::string&)> beforeUpload;
    bool failConnect = false;
    int connects = 0;
    int closes = 0;

    int count(const std::string& prefix) const {
        int n = 0;
        for (const auto& call : calls) {
            if (call.rfind(prefix, 0) == 0) ++n;
        }
        return n;
    }
};

class FakeSession : public TransferSession {
public:
    explicit FakeSession(FakeRemote& remote) : remote_(remote) {}
    ~FakeSession() override { close(); }

    std::expected<std::vector<RemoteEntry>, TransferError> listFiles(const std::string& remoteDir) override {
        remote_.calls.push_back("list " + remoteDir);
        std::vector<RemoteEntry> entries;
        std::string prefix = remoteDir.back() == '/' ? remoteDir : remoteDir + "/";
        for (const auto& [path, content] : remote_.files) {
            if (path.rfind(prefix, 0) == 0 && path.find('/', prefix.size()) == std::string::npos) {
                entries.push_back({path.substr(prefix.size()), false, content.size()});
            }
        }
        return entries;
    }

    std::expected<std::string, TransferError> download(const std::string& remotePath) override {
        remote_.calls.push_back("download " + remotePath);
        if (remote_.failDownload.contains(remotePath)) {
            return std::unexpected(TransferError{TransferErrorKind::Transfer, "connection reset by peer"});
        }
        auto it = remote_.files.find(remotePath);
        if (it == remote_.files.end()) {
            return std::unexpected(TransferError{TransferErrorKind::NotFound, "550 No such file"});
        }
        return it->second;
    }

    std::expected<void, TransferError> upload(const std::string& remotePath, const std::string& bytes) override {
        remote_.calls.push_back("upload " + remotePath);
        if (remote_.beforeUpload) {
            remote_.beforeUpload(remotePath);
        }
        if (remote_.throwForeignOnUpload.contains(remotePath)) {
            throw 42;
        }
        auto throwing = remote_.throwOnUpload.find(remotePath);
        if (throwing != remote_.throwOnUpload.end() && throwing->second > 0) {
            --throwing->second;
            remote_.files[remotePath] = "PARTIAL";
            throw std::runtime_error("socket closed unexpectedly");
        }
        auto failing = remote_.failUploads.find(remotePath);
        if (failing != remote_.failUploads.end() && failing->second > 0) {
            --failing->second;
            remote_.files[remotePath] = "PARTIAL";
            return std::unexpected(TransferError{TransferErrorKind::Transfer, "553 Permission denied"});
        }
        remote_.files[remotePath] = remote_.corruptUpload.contains(remotePath) ? bytes + "#" : bytes;
        return {};
    }

    std::expected<void, TransferError> remove(const std::string& remotePath) override {
        remote_.calls.push_back("remove " + remotePath);
        if (remote_.files.erase(remotePath) == 0) {
            return std::unexpected(TransferError{TransferErrorKind::NotFound, "550 No such file"});
        }
        return {};
    }

    std::expected<std::string, TransferError> workingDirectory() override {
        return std::string("/");
    }

    void close() override {
        if (!closed_) {
            closed_ = true;
            ++remote_.closes;
        }
    }

private:
    FakeRemote& remote_;
    bool closed_ = false;
};

class FakeTransferClient : public TransferClient {
public:
    explicit FakeTransferClient(FakeRemote& remote) : remote_(remote) {}

    std::expected<std::unique_ptr<TransferSession>, TransferError> connect(const Profile& profile) override {
        remote_.calls.push_back("connect " + profile.host);
        if (remote_.failConnect) {
            return std::unexpected(TransferError{TransferErrorKind::Connect, "530 Login incorrect"});
        }
        ++remote_.connects;
        return std::make_unique<FakeSession>(remote_);
    }

private:
    FakeRemote& remote_;
};
