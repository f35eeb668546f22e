#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 ReverseConfig 로 로드한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환.
//   부분적으로 파싱된 설정을 반환하지 않는다 (all-or-nothing).
// - 누락된 키는 구조체 기본값을 사용한다.
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "config/reverse_config.hpp"

class ConfigLoader {
public:
    ConfigLoader()  = default;
    ~ConfigLoader() = default;

    ConfigLoader(const ConfigLoader&)            = default;
    ConfigLoader& operator=(const ConfigLoader&) = default;
    ConfigLoader(ConfigLoader&&)                 = default;
    ConfigLoader& operator=(ConfigLoader&&)      = default;

    // -----------------------------------------------------------------------
    // load
    //   실패 조건:
    //   - 경로 해석 불가 / 파일 열기 실패
    //   - YAML 문법 오류, 최상위가 map 이 아님
    //   - confidence 값이 [0,1] 밖
    //   - classifier.table_prefixes 가 빈 목록
    // -----------------------------------------------------------------------
    [[nodiscard]] static std::expected<ReverseConfig, std::string>
    load(const std::filesystem::path& config_path);

    // 이미 로드된 설정의 값 범위 검증 (load 내부에서도 호출)
    [[nodiscard]] static std::expected<void, std::string> validate(const ReverseConfig& cfg);
};
