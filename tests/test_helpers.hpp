#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace librarian::testing {

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
            ("librarian_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
        path_ = std::filesystem::canonical(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    void Write(const std::string& relative, const std::string& content) const {
        const auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream output(target, std::ios::binary);
        output << content;
    }

private:
    std::filesystem::path path_;
};

class CaptureLogSink : public utils::LogSink {
public:
    void Write(const utils::LogMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(message);
    }

    std::vector<utils::LogMessage> Messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    bool Contains(const std::string& component, const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& message : messages_) {
            if (message.component == component && message.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    std::mutex mutex_;
    std::vector<utils::LogMessage> messages_;
};

// A small repository tree shared by the repo and sandbox tests.
inline void WriteSampleRepo(const TempDir& dir) {
    dir.Write("README.md", "# Sample\n\nA sample repository.\n");
    dir.Write("src/index.ts", "import { helper } from './util';\n\nexport function main() {\n  return helper();\n}\n");
    dir.Write("src/util.ts", "export function helper() {\n  // TODO: real work\n  return 42;\n}\n");
    dir.Write("src/view.tsx", "export const View = () => null;\n");
    dir.Write("src/nested/deep.ts", "export const deep = 'TODO later';\n");
    dir.Write("docs/guide.md", "Guide\nline two\n");
    dir.Write(".hidden/secret.ts", "export const hidden = 'TODO hidden';\n");
    dir.Write("node_modules/pkg/index.js", "module.exports = 'TODO dependency';\n");
}

}  // namespace librarian::testing
