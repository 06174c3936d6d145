#include "file/iterator.hpp"
#include "file/file_utils.hpp"
#include "common/storage_error.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace zgs {
namespace file {

//===========================================================================
// SegmentIterator
//===========================================================================

SegmentIterator::SegmentIterator(uint64_t file_size, uint64_t offset, uint64_t batch, bool flow_padding)
    : file_size_(file_size), batch_size_(batch), offset_(offset) {
    if (batch % DEFAULT_CHUNK_SIZE > 0) {
        throw std::invalid_argument("batch size should align with chunk size");
    }

    uint64_t chunks = num_splits(file_size, DEFAULT_CHUNK_SIZE);
    if (flow_padding) {
        padded_size_ = compute_padded_size(chunks).first * DEFAULT_CHUNK_SIZE;
    } else {
        padded_size_ = chunks * DEFAULT_CHUNK_SIZE;
    }
    buf_.reserve(batch);
}

void SegmentIterator::padding_zeros(uint64_t length) {
    buf_.resize(buf_.size() + length, 0);
    offset_ += length;
}

bool SegmentIterator::next() {
    if (offset_ >= padded_size_) {
        return false;
    }

    uint64_t expected_buf_size = std::min(batch_size_, padded_size_ - offset_);
    buf_.clear();

    if (offset_ >= file_size_) {
        padding_zeros(expected_buf_size);
        return true;
    }

    uint64_t end = std::min(offset_ + batch_size_, file_size_);
    buf_.resize(end - offset_);
    std::size_t n = read_from_source(offset_, end, buf_.data());
    buf_.resize(n);
    offset_ += n;

    if (n > expected_buf_size) {
        throw std::logic_error("load more data from file than expected");
    }

    if (n < expected_buf_size) {
        padding_zeros(expected_buf_size - n);
    }
    return true;
}

//===========================================================================
// MemIterator
//===========================================================================

MemIterator::MemIterator(std::shared_ptr<const std::vector<uint8_t>> data,
                         uint64_t offset, uint64_t batch, bool flow_padding)
    : SegmentIterator(data->size(), offset, batch, flow_padding), data_(std::move(data)) {}

std::size_t MemIterator::read_from_source(uint64_t start, uint64_t end, uint8_t* out) {
    std::size_t n = static_cast<std::size_t>(end - start);
    std::memcpy(out, data_->data() + start, n);
    return n;
}

//===========================================================================
// FileIterator
//===========================================================================

FileIterator::FileIterator(const std::filesystem::path& path, uint64_t file_size,
                           uint64_t offset, uint64_t batch, bool flow_padding)
    : SegmentIterator(file_size, offset, batch, flow_padding), path_(path),
      stream_(path, std::ios::binary) {
    if (!stream_) {
        throw FileError("cannot open " + path.string());
    }
}

std::size_t FileIterator::read_from_source(uint64_t start, uint64_t end, uint8_t* out) {
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(start), std::ios::beg);
    if (!stream_) {
        throw FileError("seek failed in " + path_.string());
    }
    stream_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(end - start));
    if (stream_.bad()) {
        throw FileError("read failed in " + path_.string());
    }
    return static_cast<std::size_t>(stream_.gcount());
}

} // namespace file
} // namespace zgs
