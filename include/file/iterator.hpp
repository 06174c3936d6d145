#ifndef ZGS_FILE_ITERATOR_HPP
#define ZGS_FILE_ITERATOR_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace zgs {
namespace file {

// Lazy sequence of batches over a byte source. Bytes past the end of the
// source, up to the padded size, read as zeros. Restart by constructing a
// new iterator.
class SegmentIterator {
public:
    SegmentIterator(uint64_t file_size, uint64_t offset, uint64_t batch, bool flow_padding);
    virtual ~SegmentIterator() = default;

    SegmentIterator(const SegmentIterator&) = delete;
    SegmentIterator& operator=(const SegmentIterator&) = delete;

    // Loads the next batch, returns false at the end of the sequence
    bool next();

    // Filled part of the buffer from the last successful next()
    const std::vector<uint8_t>& current() const { return buf_; }

    uint64_t offset() const { return offset_; }
    uint64_t padded_size() const { return padded_size_; }

protected:
    // Reads [start, end) of the source into out, returns bytes read
    virtual std::size_t read_from_source(uint64_t start, uint64_t end, uint8_t* out) = 0;

    uint64_t file_size_;

private:
    void padding_zeros(uint64_t length);

    std::vector<uint8_t> buf_;
    uint64_t padded_size_;
    uint64_t batch_size_;
    uint64_t offset_;
};

class MemIterator : public SegmentIterator {
public:
    MemIterator(std::shared_ptr<const std::vector<uint8_t>> data,
                uint64_t offset, uint64_t batch, bool flow_padding);

protected:
    std::size_t read_from_source(uint64_t start, uint64_t end, uint8_t* out) override;

private:
    std::shared_ptr<const std::vector<uint8_t>> data_;
};

// Owns its own stream, so iterators over one file are independent
class FileIterator : public SegmentIterator {
public:
    FileIterator(const std::filesystem::path& path, uint64_t file_size,
                 uint64_t offset, uint64_t batch, bool flow_padding);

protected:
    std::size_t read_from_source(uint64_t start, uint64_t end, uint8_t* out) override;

private:
    std::filesystem::path path_;
    std::ifstream stream_;
};

} // namespace file
} // namespace zgs

#endif // ZGS_FILE_ITERATOR_HPP
