#include "errors.hpp"

using namespace std;

namespace {

class zpump_error_category : public error_category {
public:
    const char *name() const noexcept override {
        return "zpump";
    }

    string message(int ev) const override {
        switch (static_cast<zerr>(ev)) {
        case zerr::ok:
            return "Success";
        case zerr::invalid_input_path:
            return "Invalid input path";
        case zerr::invalid_output_path:
            return "Invalid output path";
        case zerr::input_output_same:
            return "Input and output paths are the same";
        case zerr::path_traversal:
            return "Path traversal is not allowed";
        case zerr::output_exists:
            return "Output file already exists";
        case zerr::unknown_algorithm:
            return "Unsupported compression algorithm";
        case zerr::algorithm_not_inferable:
            return "Cannot infer compression algorithm";
        case zerr::output_required:
            return "Output path is required";
        case zerr::invalid_buffer_size:
            return "Invalid buffer size";
        case zerr::file_not_found:
            return "File not found";
        case zerr::file_not_readable:
            return "File is not readable";
        case zerr::directory_not_writable:
            return "Directory is not writable";
        case zerr::stream_open_failed:
            return "Cannot open stream";
        case zerr::stream_read_failed:
            return "Read error";
        case zerr::stream_write_failed:
            return "Write error";
        case zerr::codec_init_failed:
            return "Codec initialization failed";
        case zerr::codec_failed:
            return "Corrupted or incompatible data";
        case zerr::codec_stalled:
            return "Codec made no progress";
        case zerr::command_failed:
            return "Command failed";
        }
        return "Unknown error";
    }
};

}  // namespace

const error_category &zpump_category() noexcept {
    static zpump_error_category category;
    return category;
}

error_code make_error_code(zerr e) noexcept {
    return {static_cast<int>(e), zpump_category()};
}

err_origin origin_of(const error_code &ec) {
    if (!ec)
        return err_origin::NONE;
    if (ec.category() != zpump_category())
        return err_origin::UNEXPECTED;
    int v = ec.value();
    if (v >= 100 && v < 200)
        return err_origin::USAGE;
    if (v >= 200 && v < 300)
        return err_origin::ENVIRONMENT;
    if (v >= 300 && v < 400)
        return err_origin::CODEC;
    return err_origin::UNEXPECTED;
}

string failure::message() const {
    if (!code)
        return {};
    string msg;
    if (!command.empty())
        msg = command + ": ";
    switch (code.category() == zpump_category() ? static_cast<zerr>(code.value()) : zerr::ok) {
    case zerr::output_exists:
        // 和-f选项对应
        return msg + "Output file already exists: " + subject + ". Use -f to overwrite.";
    case zerr::algorithm_not_inferable:
        if (subject.empty())
            return msg + "Cannot infer compression algorithm from stdin. Use -m to specify one.";
        return msg + "Cannot infer compression algorithm from file extension: " + subject
               + ". Use -m to specify one.";
    case zerr::output_required:
        return msg + "Output path is required when reading from stdin. Use -o to specify one.";
    default:
        break;
    }
    msg += code.message();
    if (!subject.empty())
        msg += ": " + subject;
    if (!reason.empty())
        msg += " (" + reason + ")";
    return msg;
}
