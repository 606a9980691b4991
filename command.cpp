#include <cerrno>
#include <cstring>
#include <exception>
#include <vector>

#include <base.hpp>

#include "command.hpp"
#include "paths.hpp"
#include "progress.hpp"
#include "pump.hpp"
#include "zpump.hpp"

using namespace std;

namespace {

// 一次已解析完成的转换
struct transfer {
    const input_source &input;
    const output_destination &output;
    const codec_entry &entry;
    codec_mode mode;
    level_t level;
    size_t buffer_size;
    bool progress;
    bool create_dir;
    const char *verb;
};

}  // namespace

static string join_names(const registry &reg) {
    string s;
    for (const auto &name : reg.supported_names()) {
        if (!s.empty())
            s += ", ";
        s += name;
    }
    return s;
}

static failure unknown_algorithm(const string &name, const registry &reg) {
    return failure(zerr::unknown_algorithm, name, "supported: " + join_names(reg));
}

static failure validate_input(const input_source &src, file_handler &files) {
    // 标准输入不需要检查
    auto path = path_of(src);
    if (path == nullptr)
        return {};
    if (auto f = validate_input_path(*path))
        return f;
    if (!files.exists(*path))
        return failure(zerr::file_not_found, *path);
    if (!files.readable(*path))
        return failure(zerr::file_not_readable, *path, "permission denied");
    return {};
}

static failure validate_output(const output_destination &dst, const input_source &src,
                               bool force, bool create_dir, file_handler &files) {
    auto path = path_of(dst);
    if (path == nullptr)
        return {};
    auto in = path_of(src);
    if (auto f = validate_output_path(*path, in ? *in : string()))
        return f;
    if (!force && files.exists(*path))
        return failure(zerr::output_exists, *path);

    string dir = parent_dir(*path);
    // 解压时缺少的目录在打开输出前才创建
    if (create_dir && !files.exists(dir))
        return {};
    if (!files.writable(dir))
        return failure(zerr::directory_not_writable, dir);
    return {};
}

// 创建缺少的上级目录，created按从深到浅记录
static failure create_parents(const string &path, file_handler &files, vector<string> &created) {
    string dir = parent_dir(path);
    for (string d = dir; d != "." && d != "/" && !files.exists(d); d = parent_dir(d))
        created.push_back(d);
    if (created.empty())
        return {};
    if (auto ec = files.mkdirs(dir))
        return failure(zerr::directory_not_writable, dir, ec.message());
    return {};
}

static failure execute(const transfer &t, const cmd_context &ctx) {
    int64_t total = 0;
    if (auto path = path_of(t.input)) {
        if (auto ec = ctx.files.size(*path, total)) {
            LOGD("Cannot get size of [%s]: %s\n", path->data(), ec.message().data());
            total = 0;
        }
    }

    unique_ptr<progress_reporter> own_reporter;
    progress_reporter *reporter = ctx.reporter;
    if (reporter == nullptr) {
        own_reporter = make_reporter(t.progress, t.output, ctx.stderr_tty);
        reporter = own_reporter.get();
    }
    run_finally clear([&] { reporter->complete(); });
    reporter->set_description(string(t.verb) + " " + describe(t.input));

    stream_ptr raw_in;
    if (auto ec = ctx.files.open_input(t.input, raw_in))
        return failure(zerr::stream_open_failed, describe(t.input), ec.message());
    progress_in_stream in(std::move(raw_in), total, *reporter);

    vector<string> created;
    bool committed = false;
    // 失败时删除新建的目录
    run_finally remove_dirs([&] {
        if (committed)
            return;
        for (const auto &d : created) {
            if (!ctx.files.exists(d))
                continue;
            if (auto ec = ctx.files.remove_dir(d))
                LOGD("Cannot remove directory [%s]: %s\n", d.data(), ec.message().data());
        }
    });
    if (auto path = path_of(t.output); path && t.create_dir) {
        if (auto f = create_parents(*path, ctx.files, created))
            return f;
    }

    stream_ptr out;
    if (auto ec = ctx.files.open_output(t.output, out))
        return failure(zerr::stream_open_failed, describe(t.output), ec.message());

    // 从这里开始，失败时必须删除不完整的输出
    run_finally rollback([&] {
        if (committed)
            return;
        if (!out->close())
            LOGD("Closing [%s] failed: %s\n", describe(t.output).data(), strerror(errno));
        if (auto path = path_of(t.output)) {
            if (auto ec = ctx.files.remove(*path))
                LOGW("Cannot remove partial output [%s]: %s\n", path->data(), ec.message().data());
        }
    });

    LOGD("%s [%s] to [%s] with %s\n", t.verb, describe(t.input).data(),
         describe(t.output).data(), t.entry.name.data());

    if (auto f = pump(in, *out, t.entry, t.mode, t.level, t.buffer_size)) {
        // 流错误补上对应的端点
        if (f.subject.empty()) {
            if (f.is(zerr::stream_read_failed))
                f.subject = describe(t.input);
            else if (f.is(zerr::stream_write_failed))
                f.subject = describe(t.output);
        }
        return f;
    }

    if (!out->close())
        return failure(zerr::stream_write_failed, describe(t.output), strerror(errno));
    committed = true;
    if (!in.close())
        LOGD("Closing [%s] failed: %s\n", describe(t.input).data(), strerror(errno));
    return {};
}

static failure wrap_unexpected(const char *command, const input_source &src, const exception &e) {
    failure f(zerr::command_failed, describe(src), e.what());
    f.command = command;
    return f;
}

static failure do_compress(const compress_opts &opts, const cmd_context &ctx) {
    if (opts.buffer_size > MAX_BUFFER_SIZE)
        return failure(zerr::invalid_buffer_size, to_string(opts.buffer_size));

    if (auto f = validate_input(opts.input, ctx.files))
        return f;

    const level_preset &preset = get_preset(opts.level);
    string name = opts.algorithm.empty() ? fmt2name[preset.fmt] : opts.algorithm;
    const codec_entry *entry = ctx.reg.lookup(name);
    if (entry == nullptr)
        return unknown_algorithm(name, ctx.reg);

    output_destination output;
    if (opts.output) {
        output = *opts.output;
    } else if (auto path = path_of(opts.input)) {
        // 默认路径已存在时由下面的检查报错
        output = file_path{ compress_output_path(*path, entry->name) };
    } else {
        return failure(zerr::output_required);
    }

    if (auto f = validate_output(output, opts.input, opts.force, false, ctx.files))
        return f;

    transfer t {
        opts.input, output, *entry, codec_mode::ENCODE, opts.level,
        opts.buffer_size ? opts.buffer_size : preset.buffer_size,
        opts.progress, false, "Compressing",
    };
    return execute(t, ctx);
}

static failure do_decompress(const decompress_opts &opts, const cmd_context &ctx) {
    if (opts.buffer_size > MAX_BUFFER_SIZE)
        return failure(zerr::invalid_buffer_size, to_string(opts.buffer_size));

    if (auto f = validate_input(opts.input, ctx.files))
        return f;

    // 显式指定的算法优先于扩展名
    const codec_entry *entry;
    if (!opts.algorithm.empty()) {
        entry = ctx.reg.lookup(opts.algorithm);
        if (entry == nullptr)
            return unknown_algorithm(opts.algorithm, ctx.reg);
    } else if (auto path = path_of(opts.input)) {
        string name = infer_algorithm(*path, ctx.reg);
        if (name.empty())
            return failure(zerr::algorithm_not_inferable, *path, "supported: " + join_names(ctx.reg));
        entry = ctx.reg.lookup(name);
    } else {
        return failure(zerr::algorithm_not_inferable);
    }

    output_destination output;
    if (opts.output) {
        output = *opts.output;
    } else if (auto path = path_of(opts.input)) {
        output = file_path{ decompress_output_path(*path, entry->name, [&](const string &p) {
            return ctx.files.exists(p);
        }) };
    } else {
        return failure(zerr::output_required);
    }

    if (auto f = validate_output(output, opts.input, opts.force, true, ctx.files))
        return f;

    transfer t {
        opts.input, output, *entry, codec_mode::DECODE, BALANCED,
        opts.buffer_size ? opts.buffer_size : DEFAULT_BUFFER_SIZE,
        opts.progress, true, "Decompressing",
    };
    return execute(t, ctx);
}

failure run_compress(const compress_opts &opts, const cmd_context &ctx) {
    try {
        return do_compress(opts, ctx);
    } catch (const exception &e) {
        return wrap_unexpected("compress", opts.input, e);
    }
}

failure run_decompress(const decompress_opts &opts, const cmd_context &ctx) {
    try {
        return do_decompress(opts, ctx);
    } catch (const exception &e) {
        return wrap_unexpected("decompress", opts.input, e);
    }
}
