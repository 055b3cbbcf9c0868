#include <stencil/archive.hpp>
#include <stencil/log.hpp>
#include <archive.h>
#include <archive_entry.h>

#include <atomic>
#include <memory>

#include <unistd.h>

namespace fs = std::filesystem;

namespace stencil {

using ArchiveReader = std::unique_ptr<struct archive, int (*)(struct archive*)>;

static Status copy_data(struct archive* in, struct archive* out) {
    const void* buf;
    size_t size;
    la_int64_t offset;
    for (;;) {
        int rc = archive_read_data_block(in, &buf, &size, &offset);
        if (rc == ARCHIVE_EOF) return ok_status();
        if (rc < ARCHIVE_OK) {
            return StencilError{StencilError::IO,
                std::string("archive read failed: ") + archive_error_string(in)};
        }
        if (archive_write_data_block(out, buf, size, offset) < ARCHIVE_OK) {
            return StencilError{StencilError::IO,
                std::string("archive write failed: ") + archive_error_string(out)};
        }
    }
}

// Relative path without ".." components
static bool is_contained(const std::string& name) {
    fs::path p(name);
    if (p.is_absolute() || p.has_root_name()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

Status extract_archive(const std::string& data, const fs::path& dest) {
    ArchiveReader reader(archive_read_new(), archive_read_free);
    ArchiveReader writer(archive_write_disk_new(), archive_write_free);
    if (!reader || !writer) {
        return StencilError{StencilError::IO, "failed to allocate archive handles"};
    }

    archive_read_support_filter_all(reader.get());
    archive_read_support_format_all(reader.get());
    archive_write_disk_set_options(writer.get(),
        ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_memory(reader.get(), data.data(), data.size()) != ARCHIVE_OK) {
        return StencilError{StencilError::TemplateProcessing,
            std::string("not a readable archive: ") + archive_error_string(reader.get())};
    }

    size_t count = 0;
    struct archive_entry* entry = nullptr;
    for (;;) {
        int rc = archive_read_next_header(reader.get(), &entry);
        if (rc == ARCHIVE_EOF) break;
        if (rc < ARCHIVE_WARN) {
            return StencilError{StencilError::TemplateProcessing,
                std::string("corrupt archive: ") + archive_error_string(reader.get())};
        }

        const char* raw_name = archive_entry_pathname(entry);
        if (!raw_name) continue;
        std::string name(raw_name);
        if (!is_contained(name)) {
            return StencilError{StencilError::TemplateProcessing,
                "archive entry escapes extraction root: " + name};
        }
        fs::path target = dest / name;
        archive_entry_set_pathname(entry, target.string().c_str());

        // Hard link targets are archive paths too and must land under dest
        if (const char* link = archive_entry_hardlink(entry)) {
            if (!is_contained(link)) {
                return StencilError{StencilError::TemplateProcessing,
                    "archive hard link escapes extraction root: " + std::string(link)};
            }
            archive_entry_set_hardlink(entry, (dest / link).string().c_str());
        }

        if (archive_write_header(writer.get(), entry) < ARCHIVE_OK) {
            return StencilError{StencilError::IO,
                "cannot extract '" + name + "': " +
                archive_error_string(writer.get())};
        }
        if (archive_entry_size(entry) > 0) {
            STENCIL_TRY(copy_data(reader.get(), writer.get()));
        }
        if (archive_write_finish_entry(writer.get()) < ARCHIVE_OK) {
            return StencilError{StencilError::IO,
                std::string("cannot finish entry: ") + archive_error_string(writer.get())};
        }
        ++count;
    }

    if (count == 0) {
        return StencilError{StencilError::TemplateProcessing, "archive is empty"};
    }
    stencil::log::debug("extracted %zu entries into %s", count, dest.string().c_str());
    return ok_status();
}

Result<fs::path> make_staging_dir(const fs::path& final_dir) {
    static std::atomic<unsigned> counter{0};
    fs::path staging = final_dir;
    staging += ".partial-" + std::to_string(getpid()) + "-" + std::to_string(counter++);

    std::error_code ec;
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) {
        return StencilError{StencilError::IO,
            "cannot create staging directory " + staging.string() + ": " + ec.message()};
    }
    return Result<fs::path>::ok(std::move(staging));
}

Status commit_staging_dir(const fs::path& staging, const fs::path& final_dir) {
    std::error_code ec;
    fs::remove_all(final_dir, ec);
    if (ec) {
        return StencilError{StencilError::IO,
            "cannot replace " + final_dir.string() + ": " + ec.message()};
    }
    fs::rename(staging, final_dir, ec);
    if (ec) {
        fs::remove_all(staging, ec);
        return StencilError{StencilError::IO,
            "cannot move staging directory into " + final_dir.string()};
    }
    return ok_status();
}

fs::path archive_root(const fs::path& dir) {
    std::error_code ec;
    fs::path only;
    size_t count = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name == kSourceMarker) continue;
        if (++count > 1) return dir;
        only = it->path();
    }
    if (count == 1 && fs::is_directory(only, ec)) return only;
    return dir;
}

} // namespace stencil
