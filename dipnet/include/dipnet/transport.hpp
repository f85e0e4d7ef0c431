/*
 * 설명: 하나의 장기 양방향 연결 위에서 텍스트 프레임을 주고받는 전송 계층 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/correlator_test.cpp, dipnet/tests/e2e/client_flow_test.cpp
 */
#pragma once

#include <functional>
#include <string>

namespace dipnet {

class Transport {
 public:
  using FrameHandler = std::function<void(std::string frame)>;
  using ClosedHandler = std::function<void(const std::string& reason)>;

  virtual ~Transport() = default;

  // on_frame은 수신 순서대로 하나의 수신 스레드에서 호출된다. on_closed는 최대 한 번 호출된다.
  virtual void Start(FrameHandler on_frame, ClosedHandler on_closed) = 0;
  // 여러 스레드에서 호출할 수 있다. 닫힌 연결이면 ConnectionClosedError.
  virtual void Send(std::string frame) = 0;
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;
};

}  // namespace dipnet
