#pragma once

#include <string>
#include <filesystem>

namespace tradeagent {
namespace utils {

class PathUtils {
public:
    // 실행 파일 디렉토리 (/proc/self/exe 기준, 실패 시 현재 작업 디렉토리)
    static std::filesystem::path getExecutableDir();

    // 절대 경로는 그대로, 상대 경로는 작업 디렉토리에 있으면 그 경로, 없으면 실행 파일 기준
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace tradeagent
