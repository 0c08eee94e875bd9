#pragma once

#include <string>
#include <filesystem>

namespace swingfib {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환
    static std::filesystem::path getExecutableDir();

    // 작업 디렉토리에 존재하면 그 경로, 아니면 실행 파일 기준 경로
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace swingfib
