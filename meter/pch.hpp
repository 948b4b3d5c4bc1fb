// 预编译头文件 (PCH)
// 包含稳定的标准库和第三方库头文件，以及被所有头文件依赖的公共工具
#pragma once

// ==================== C++ 标准库 ====================

// 容器
#include <string>
#include <vector>
#include <map>
#include <set>
#include <array>
#include <deque>

// 工具
#include <functional>
#include <optional>
#include <memory>
#include <chrono>
#include <thread>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <type_traits>

// IO / 格式化
#include <sstream>
#include <iomanip>
#include <iostream>
#include <fstream>
#include <filesystem>

// 其他
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <csignal>
#include <cmath>
#include <algorithm>
#include <utility>
#include <exception>
#include <stdexcept>

// ==================== Trantor ====================

#include <trantor/net/EventLoop.h>
#include <trantor/utils/Logger.h>
#include <trantor/utils/AsyncFileLogger.h>
#include <trantor/utils/Date.h>

// ==================== 第三方库 ====================

#include <json/json.h>

// Utils
#include "common/utils/Constants.hpp"
#include "common/utils/ErrorCodes.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/LoggerManager.hpp"
