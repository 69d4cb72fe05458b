#ifndef EDGEMESH_SCOPED_TEMP_FILE_HXX
#define EDGEMESH_SCOPED_TEMP_FILE_HXX

#include <string>

// Unique path in the system temp directory; the file (if created) is removed on destruction.
class ScopedTempFile {
public:
    explicit ScopedTempFile(const std::string& extension);
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

#endif // EDGEMESH_SCOPED_TEMP_FILE_HXX
