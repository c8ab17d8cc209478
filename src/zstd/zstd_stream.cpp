#include "dirimg/zstd_stream.hpp"

#include <zstd.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dirimg::zstd {
namespace {

constexpr std::size_t kInputBufferSize = 64U * 1024U;

std::runtime_error ZstdError(const std::string& message) {
  return std::runtime_error("zstd: " + message);
}

std::size_t CheckZstd(std::size_t code, const char* operation) {
  if (ZSTD_isError(code) != 0U) {
    throw ZstdError(std::string(operation) + ": " + ZSTD_getErrorName(code));
  }
  return code;
}

struct CCtxDeleter {
  void operator()(ZSTD_CCtx* ctx) const { ZSTD_freeCCtx(ctx); }
};

struct DCtxDeleter {
  void operator()(ZSTD_DCtx* ctx) const { ZSTD_freeDCtx(ctx); }
};

class CompressingStream final : public ByteStream {
 public:
  CompressingStream(std::unique_ptr<ByteStream> input, int level)
      : input_(std::move(input)), ctx_(ZSTD_createCCtx()), in_buffer_(kInputBufferSize) {
    if (input_ == nullptr) {
      throw std::invalid_argument("zstd: input stream is required");
    }
    if (ctx_ == nullptr) {
      throw ZstdError("failed to create compression context");
    }
    CheckZstd(ZSTD_CCtx_setParameter(ctx_.get(), ZSTD_c_compressionLevel, level), "set compression level");
    CheckZstd(ZSTD_CCtx_setParameter(ctx_.get(), ZSTD_c_nbWorkers, 0), "set worker count");
  }

  std::size_t Read(std::span<std::byte> out) override {
    if (out.empty()) {
      return 0;
    }
    if (pending_offset_ == pending_.size()) {
      pending_.clear();
      pending_offset_ = 0;
      if (finished_) {
        return 0;
      }
      Fill();
      if (pending_.empty()) {
        return 0;
      }
    }
    const auto n = std::min(out.size(), pending_.size() - pending_offset_);
    std::memcpy(out.data(), pending_.data() + pending_offset_, n);
    pending_offset_ += n;
    return n;
  }

 private:
  // Compresses until kOutputChunkSize bytes are buffered or the input is exhausted.
  // Errors from the input propagate to the reader.
  void Fill() {
    const std::size_t out_step = ZSTD_CStreamOutSize();
    while (pending_.size() < kOutputChunkSize && !finished_) {
      const auto got = input_->Read(in_buffer_);
      const bool last = got == 0;
      ZSTD_inBuffer in{in_buffer_.data(), got, 0};
      const ZSTD_EndDirective mode = last ? ZSTD_e_end : ZSTD_e_continue;
      bool drained = false;
      while (!drained) {
        const auto base = pending_.size();
        pending_.resize(base + out_step);
        ZSTD_outBuffer chunk{pending_.data() + base, out_step, 0};
        const auto remaining = CheckZstd(ZSTD_compressStream2(ctx_.get(), &chunk, &in, mode), "compress");
        pending_.resize(base + chunk.pos);
        drained = last ? remaining == 0 : in.pos == in.size;
      }
      finished_ = last;
    }
  }

  std::unique_ptr<ByteStream> input_;
  std::unique_ptr<ZSTD_CCtx, CCtxDeleter> ctx_;
  std::vector<std::byte> in_buffer_;
  std::vector<std::byte> pending_{};
  std::size_t pending_offset_ = 0;
  bool finished_ = false;
};

class DecompressingStream final : public ByteStream {
 public:
  explicit DecompressingStream(std::unique_ptr<ByteStream> input)
      : input_(std::move(input)), ctx_(ZSTD_createDCtx()), in_buffer_(ZSTD_DStreamInSize()) {
    if (input_ == nullptr) {
      throw std::invalid_argument("zstd: input stream is required");
    }
    if (ctx_ == nullptr) {
      throw ZstdError("failed to create decompression context");
    }
  }

  std::size_t Read(std::span<std::byte> out) override {
    if (out.empty()) {
      return 0;
    }
    while (true) {
      if (in_.pos == in_.size && !input_eof_) {
        const auto got = input_->Read(in_buffer_);
        in_ = ZSTD_inBuffer{in_buffer_.data(), got, 0};
        input_eof_ = got == 0;
        saw_input_ = saw_input_ || got > 0;
      }
      ZSTD_outBuffer chunk{out.data(), out.size(), 0};
      frame_hint_ = CheckZstd(ZSTD_decompressStream(ctx_.get(), &chunk, &in_), "decompress");
      if (chunk.pos > 0) {
        return chunk.pos;
      }
      if (input_eof_ && in_.pos == in_.size) {
        if (saw_input_ && frame_hint_ != 0) {
          throw ZstdError("truncated frame");
        }
        return 0;
      }
    }
  }

 private:
  std::unique_ptr<ByteStream> input_;
  std::unique_ptr<ZSTD_DCtx, DCtxDeleter> ctx_;
  std::vector<std::byte> in_buffer_;
  ZSTD_inBuffer in_{nullptr, 0, 0};
  std::size_t frame_hint_ = 0;
  bool input_eof_ = false;
  bool saw_input_ = false;
};

}  // namespace

std::unique_ptr<ByteStream> CompressStream(std::unique_ptr<ByteStream> input, int level) {
  return std::make_unique<CompressingStream>(std::move(input), level);
}

std::unique_ptr<ByteStream> DecompressStream(std::unique_ptr<ByteStream> input) {
  return std::make_unique<DecompressingStream>(std::move(input));
}

}  // namespace dirimg::zstd
