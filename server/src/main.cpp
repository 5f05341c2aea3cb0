/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <iostream>

#include "otpgate/app.hpp"
#include "otpgate/errors.hpp"

int main() {
  using namespace otpgate;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);
    app.Run();
  } catch (const OtpException& ex) {
    std::cerr << "설정 오류 (" << ErrorKindName(ex.kind()) << "): " << ex.what() << "\n";
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "서버 종료: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
