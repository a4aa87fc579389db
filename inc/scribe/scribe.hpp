#ifndef SCRIBE_HPP
#define SCRIBE_HPP

// =============================================================================
// Scribe - 主包含文件
// =============================================================================
//
// 只需包含此文件即可使用批量转写框架
//
//   #include <scribe/scribe.hpp>
//
// 快速开始:
//
//   // 1. 解析引擎参数
//   scribe::ArgumentSet args = {{"threads", scribe::ParamValue(4)}};
//   auto params = scribe::ParamResolver::resolve(args);
//
//   // 2. 创建并初始化引擎 (EngineBackendFactory 需链接 scribe_whisper)
//   #include <scribe/backends/backend_factory.hpp>
//   scribe::Engine engine(scribe::EngineBackendFactory::create(scribe::BackendType::WHISPER));
//   auto err = engine.initialize("base.en", params);
//   if (!err.isOk()) {
//       std::cerr << "Init failed: " << err.message << std::endl;
//       return 1;
//   }
//
//   // 3. 批量转写
//   scribe::OutputOptions outputs;
//   outputs.srt = true;
//   scribe::BatchRunner runner(engine, outputs, 1);
//   auto result = runner.run({"a.wav", "b.wav"});
//

#include <string>

// 核心类型
#include "scribe_types.hpp"
#include "cancellation.hpp"

// 参数
#include "params.hpp"
#include "cli_config.hpp"

// 回调接口
#include "transcription_callback.hpp"

// 引擎与批处理
#include "engine.hpp"
#include "batch_runner.hpp"
#include "output_writers.hpp"

// 后端接口 (通常不需要直接使用)
#include "backends/engine_backend.hpp"

namespace scribe {

// =============================================================================
// 版本信息
// =============================================================================

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string getVersionString() {
    return std::to_string(VERSION_MAJOR) + "." +
        std::to_string(VERSION_MINOR) + "." +
        std::to_string(VERSION_PATCH);
}

}  // namespace scribe

#endif  // SCRIBE_HPP
