#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    FASTXLS_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     FASTXLS_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     FASTXLS_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    FASTXLS_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 复合文档模块 (ole)
#define OLE_DEBUG(...)     FASTXLS_LOG_DEBUG("[DBG][ole ] " __VA_ARGS__)
#define OLE_INFO(...)      FASTXLS_LOG_INFO("[INF][ole ] " __VA_ARGS__)
#define OLE_WARN(...)      FASTXLS_LOG_WARN("[WRN][ole ] " __VA_ARGS__)
#define OLE_ERROR(...)     FASTXLS_LOG_ERROR("[ERR][ole ] " __VA_ARGS__)

// 记录模块 (biff)
#define BIFF_TRACE(...)    FASTXLS_LOG_TRACE("[TRC][biff] " __VA_ARGS__)
#define BIFF_DEBUG(...)    FASTXLS_LOG_DEBUG("[DBG][biff] " __VA_ARGS__)
#define BIFF_INFO(...)     FASTXLS_LOG_INFO("[INF][biff] " __VA_ARGS__)
#define BIFF_WARN(...)     FASTXLS_LOG_WARN("[WRN][biff] " __VA_ARGS__)
#define BIFF_ERROR(...)    FASTXLS_LOG_ERROR("[ERR][biff] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_TRACE(...)  FASTXLS_LOG_TRACE("[TRC][read] " __VA_ARGS__)
#define READER_DEBUG(...)  FASTXLS_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   FASTXLS_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   FASTXLS_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  FASTXLS_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// 示例模块 (demo)
#define DEMO_INFO(...)     FASTXLS_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define DEMO_WARN(...)     FASTXLS_LOG_WARN("[WRN][demo] " __VA_ARGS__)
#define DEMO_ERROR(...)    FASTXLS_LOG_ERROR("[ERR][demo] " __VA_ARGS__)
