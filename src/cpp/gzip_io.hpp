#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include <iostream>
#include <cstdio>
#include <zlib.h>

namespace dotstar {

/**
 * @brief RAII wrapper for reading a possibly gzipped file.
 *
 * zlib passes uncompressed files through unchanged, so the same reader
 * serves plain text and .gz input.
 */
class GzipReader {
private:
    gzFile file_;
    std::string path_;
    bool is_open_;

public:
    /**
     * @brief Opens a file for reading (auto-detects gzip compression).
     *
     * @param path Input file path
     * @throws std::runtime_error If file cannot be opened
     */
    explicit GzipReader(const std::string& path)
        : path_(path), is_open_(false) {

        file_ = gzopen(path.c_str(), "rb");

        if (file_ == nullptr) {
            throw std::runtime_error("Cannot open file for reading: " + path);
        }

        is_open_ = true;
    }

    ~GzipReader() {
        close();
    }

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    /**
     * @brief Reads up to size decompressed bytes.
     *
     * @return Number of bytes actually read (0 at EOF)
     * @throws std::runtime_error If read fails
     */
    size_t read(void* data, size_t size) {
        if (!is_open_) {
            throw std::runtime_error("Attempt to read from closed file: " + path_);
        }

        int bytes_read = gzread(file_, data, static_cast<unsigned int>(size));
        if (bytes_read < 0) {
            int errnum;
            const char* errmsg = gzerror(file_, &errnum);
            throw std::runtime_error("Failed to read from file " + path_ +
                                    ": " + std::string(errmsg));
        }

        return static_cast<size_t>(bytes_read);
    }

    void close() {
        if (is_open_) {
            if (gzclose(file_) != Z_OK) {
                std::cerr << "Warning: Failed to close file: " << path_ << std::endl;
            }
            is_open_ = false;
        }
    }

    bool is_open() const {
        return is_open_;
    }
};

/**
 * @brief Checks if a file is gzip-compressed by reading its magic bytes.
 *
 * @param path File path to check
 * @return true if the file is gzipped, false otherwise (including unreadable files)
 */
inline bool is_gzipped_file(const std::string& path) {
    FILE* f = fopen(path.c_str(), "rb");
    if (f == nullptr) {
        return false;
    }

    // gzip magic: 0x1f 0x8b
    unsigned char magic[2];
    size_t bytes_read = fread(magic, 1, 2, f);
    fclose(f);

    if (bytes_read != 2) {
        return false;
    }

    return (magic[0] == 0x1f && magic[1] == 0x8b);
}

/**
 * @brief Reads a whole plain or gzipped file into memory.
 *
 * @param path Input file path
 * @return Decompressed file contents
 * @throws std::runtime_error If the file cannot be opened or read, or if it
 *         carries the gzip magic bytes but does not decompress
 */
inline std::string read_text_file(const std::string& path) {
    const bool compressed = is_gzipped_file(path);
    GzipReader reader(path);
    std::string out;
    std::vector<char> buf(1 << 16);
    try {
        size_t n;
        while ((n = reader.read(buf.data(), buf.size())) > 0) {
            out.append(buf.data(), n);
        }
    } catch (const std::runtime_error& e) {
        if (compressed) {
            throw std::runtime_error("Corrupt gzip file " + path + ": " + e.what());
        }
        throw;
    }
    return out;
}

} // namespace dotstar
