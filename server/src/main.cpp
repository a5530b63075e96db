/*
 * 설명: 브로커 진입점으로 환경설정을 로드해 실행한다. 시작 실패 시 0이 아닌 코드로 종료한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "broker/app.hpp"

int main() {
  using namespace broker;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);
    app.Run();
  } catch (const ConfigError& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 1;
  } catch (const StoreError& ex) {
    std::cerr << "저장소 연결 실패: " << ex.what() << "\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "서버 시작 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
