/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#ifndef EXT4SHIM_SRC_INCLUDE_EXPECTED_HPP_
#define EXT4SHIM_SRC_INCLUDE_EXPECTED_HPP_

#include <cstdint>
#include <expected>

/// 错误码
enum class ErrorCode : uint64_t {
  kSuccess = 0,
  // 块设备相关错误 (0x700 - 0x7FF)
  kBlkDeviceNotFound = 0x700,
  kBlkReadFailed = 0x701,
  kBlkWriteFailed = 0x702,
  kBlkUnalignedOffset = 0x703,
  kBlkSectorSizeMismatch = 0x704,
  kBlkRegistryFull = 0x705,
  // 文件系统相关错误 (0x800 - 0x8FF)
  kFsFileNotFound = 0x800,
  kFsUnexpectedEof = 0x801,
  kFsNotSupported = 0x802,
  kFsNotImplemented = 0x803,
  kFsAllocFailed = 0x804,
  kFsLinkFailed = 0x805,
  kFsPermissionDenied = 0x806,
  kFsNoSpace = 0x807,
  kFsIoError = 0x808,
  kFsFileExists = 0x809,
  kFsNotADirectory = 0x80A,
  kFsIsADirectory = 0x80B,
  kFsDirNotEmpty = 0x80C,
  kFsInvalidOpenFlags = 0x80D,
  kFsReadOnly = 0x80E,
  kFsNameTooLong = 0x80F,
  kFsMkdirOpenFailed = 0x810,
  kFsUnmappedEngineError = 0x811,
  kFsMountFailed = 0x812,
  // 通用错误 (0xF00 - 0xFFF)
  kInvalidArgument = 0xF00,
  kOutOfMemory = 0xF01,
};

/// 获取错误码对应的错误信息
constexpr auto GetErrorMessage(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kBlkDeviceNotFound:
      return "Block device not found";
    case ErrorCode::kBlkReadFailed:
      return "Block device read failed";
    case ErrorCode::kBlkWriteFailed:
      return "Block device write failed";
    case ErrorCode::kBlkUnalignedOffset:
      return "Offset is not sector aligned";
    case ErrorCode::kBlkSectorSizeMismatch:
      return "Unsupported sector size";
    case ErrorCode::kBlkRegistryFull:
      return "Block device registry full";
    case ErrorCode::kFsFileNotFound:
      return "File not found";
    case ErrorCode::kFsUnexpectedEof:
      return "Unexpected end of data";
    case ErrorCode::kFsNotSupported:
      return "Operation not supported";
    case ErrorCode::kFsNotImplemented:
      return "Operation not implemented";
    case ErrorCode::kFsAllocFailed:
      return "Filesystem allocation failed";
    case ErrorCode::kFsLinkFailed:
      return "Directory link failed";
    case ErrorCode::kFsPermissionDenied:
      return "Permission denied";
    case ErrorCode::kFsNoSpace:
      return "No space left on device";
    case ErrorCode::kFsIoError:
      return "I/O error";
    case ErrorCode::kFsFileExists:
      return "File exists";
    case ErrorCode::kFsNotADirectory:
      return "Not a directory";
    case ErrorCode::kFsIsADirectory:
      return "Is a directory";
    case ErrorCode::kFsDirNotEmpty:
      return "Directory not empty";
    case ErrorCode::kFsInvalidOpenFlags:
      return "Unsupported open flags combination";
    case ErrorCode::kFsReadOnly:
      return "Read-only filesystem";
    case ErrorCode::kFsNameTooLong:
      return "File name too long";
    case ErrorCode::kFsMkdirOpenFailed:
      return "Directory created but could not be opened";
    case ErrorCode::kFsUnmappedEngineError:
      return "Unmapped filesystem engine error";
    case ErrorCode::kFsMountFailed:
      return "Filesystem mount failed";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfMemory:
      return "Out of memory";
    default:
      return "Unknown error";
  }
}

/// 错误类型，用于 std::expected
struct Error {
  ErrorCode code;

  constexpr Error(ErrorCode c) : code(c) {}

  [[nodiscard]] constexpr auto message() const -> const char* {
    return GetErrorMessage(code);
  }
};

/// std::expected 别名模板
template <typename T>
using Expected = std::expected<T, Error>;

#endif /* EXT4SHIM_SRC_INCLUDE_EXPECTED_HPP_ */
