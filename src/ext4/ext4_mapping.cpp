/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "ext4_mapping.hpp"

#include "kernel_log.hpp"

namespace ext4 {

auto TranslateOpenFlags(uint32_t flags) -> Expected<OpenRequest> {
  const bool create = (flags & vfs::kOCreate) != 0U;

  // kOReadOnly == 0，只能精确匹配
  switch (flags) {
    case vfs::kOReadOnly:
      return OpenRequest{OpenMode::kRead, create};
    case vfs::kOWriteOnly | vfs::kOCreate | vfs::kOTruncate:
      return OpenRequest{OpenMode::kWrite, create};
    case vfs::kOWriteOnly | vfs::kOCreate | vfs::kOAppend:
      return OpenRequest{OpenMode::kAppend, create};
    case vfs::kOReadWrite:
      return OpenRequest{OpenMode::kReadWrite, create};
    case vfs::kOReadWrite | vfs::kOCreate | vfs::kOTruncate:
      return OpenRequest{OpenMode::kReadWriteTruncate, create};
    case vfs::kOReadWrite | vfs::kOCreate | vfs::kOAppend:
      return OpenRequest{OpenMode::kReadWriteAppend, create};
    default:
      klog::Warn("TranslateOpenFlags: unsupported flags 0x%x\n", flags);
      return std::unexpected(Error(ErrorCode::kFsInvalidOpenFlags));
  }
}

auto OpenModeToString(OpenMode mode) -> std::string_view {
  switch (mode) {
    case OpenMode::kRead:
      return "r";
    case OpenMode::kWrite:
      return "w";
    case OpenMode::kAppend:
      return "a";
    case OpenMode::kReadWrite:
      return "r+";
    case OpenMode::kReadWriteTruncate:
      return "w+";
    case OpenMode::kReadWriteAppend:
      return "a+";
  }
  return "r";
}

auto OpenModeWritable(OpenMode mode) -> bool { return mode != OpenMode::kRead; }

auto MapEngineError(Errnum err) -> ErrorCode {
  switch (err) {
    case Errnum::kENOENT:
      return ErrorCode::kFsFileNotFound;
    case Errnum::kEALLOCFAIL:
    case Errnum::kENOMEM:
      return ErrorCode::kFsAllocFailed;
    case Errnum::kELINKFAIL:
    case Errnum::kEMLINK:
      return ErrorCode::kFsLinkFailed;
    case Errnum::kEPERM:
    case Errnum::kEACCES:
      return ErrorCode::kFsPermissionDenied;
    case Errnum::kENOSPC:
    case Errnum::kEFBIG:
      return ErrorCode::kFsNoSpace;
    case Errnum::kEIO:
    case Errnum::kENXIO:
    case Errnum::kENODEV:
      return ErrorCode::kFsIoError;
    case Errnum::kENODATA:
      return ErrorCode::kFsUnexpectedEof;
    case Errnum::kEEXIST:
      return ErrorCode::kFsFileExists;
    case Errnum::kENOTDIR:
      return ErrorCode::kFsNotADirectory;
    case Errnum::kEISDIR:
      return ErrorCode::kFsIsADirectory;
    case Errnum::kENOTEMPTY:
      return ErrorCode::kFsDirNotEmpty;
    case Errnum::kEROFS:
      return ErrorCode::kFsReadOnly;
    case Errnum::kENAMETOOLONG:
      return ErrorCode::kFsNameTooLong;
    case Errnum::kEINVAL:
    case Errnum::kE2BIG:
    case Errnum::kERANGE:
    case Errnum::kEFAULT:
      return ErrorCode::kInvalidArgument;
    case Errnum::kENOTSUP:
      return ErrorCode::kFsNotSupported;
  }
  klog::Warn("MapEngineError: unmapped engine error %d\n",
             static_cast<int>(err));
  return ErrorCode::kFsUnmappedEngineError;
}

auto MapDirEntryType(uint8_t type) -> vfs::FileType {
  switch (type) {
    case DirEntryType::kRegFile:
    case DirEntryType::kChrDev:
    case DirEntryType::kBlkDev:
    case DirEntryType::kSock:
      return vfs::FileType::kRegular;
    case DirEntryType::kDir:
      return vfs::FileType::kDirectory;
    case DirEntryType::kSymlink:
      return vfs::FileType::kSymlink;
    case DirEntryType::kFifo:
      return vfs::FileType::kFifo;
    default:
      return vfs::FileType::kUnknown;
  }
}

auto MapInodeMode(uint16_t mode) -> vfs::FileType {
  // 与目录项使用同一套归类，ReadDir 与 GetMetadata 对同一 inode 给出相同类型；
  // 设备种类仍保留在 GetStat 的 mode 中
  switch (mode & vfs::kSIfMt) {
    case vfs::kSIfReg:
      return MapDirEntryType(DirEntryType::kRegFile);
    case vfs::kSIfDir:
      return MapDirEntryType(DirEntryType::kDir);
    case vfs::kSIfChr:
      return MapDirEntryType(DirEntryType::kChrDev);
    case vfs::kSIfBlk:
      return MapDirEntryType(DirEntryType::kBlkDev);
    case vfs::kSIfIfo:
      return MapDirEntryType(DirEntryType::kFifo);
    case vfs::kSIfSock:
      return MapDirEntryType(DirEntryType::kSock);
    case vfs::kSIfLnk:
      return MapDirEntryType(DirEntryType::kSymlink);
    default:
      return vfs::FileType::kUnknown;
  }
}

}  // namespace ext4
