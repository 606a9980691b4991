// zpump主程序文件
#include <base.hpp>
#include <getopt.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>

#include "command.hpp"
#include "zpump.hpp"

using namespace std;

// 打印支持的压缩格式
static void print_formats(const registry &reg, FILE *out) {
    for (const auto &name : reg.supported_names()) {
        fprintf(out, "%s ", name.data());
    }
}

// 显示使用帮助信息
static void usage(char *arg0, const registry &reg, int code = 1) {
    fprintf(stderr,
R"EOF(zpump - 流式压缩/解压缩工具

用法: %s <操作> [选项...] <infile>

支持的操作:
  compress, c [-m METHOD] [-l LEVEL] [-o OUT] [-b BYTES] [-f] [-p] <infile>
    使用METHOD将<infile>压缩为OUT。
    <infile>/OUT可以是'-'表示STDIN/STDOUT。
    如果未指定METHOD，则使用LEVEL推荐的算法：
      fast: lz4, 256KB块
      balanced: gzip, 64KB块（默认）
      best: xz, 64KB块
    如果未指定OUT，输出到<infile>.<METHOD>。
    输入为STDIN且STDOUT不是终端时，默认输出到STDOUT。

  decompress, x [-m METHOD] [-o OUT] [-b BYTES] [-f] [-p] <infile>
    使用METHOD将<infile>解压缩为OUT。
    如果未指定METHOD，根据<infile>的扩展名推断，
    输入为STDIN时必须指定。
    如果未指定OUT，输出到去掉扩展名的<infile>，
    该文件已存在时再追加".out"。缺少的目录会被创建。

  formats
    列出支持的格式

选项:
  -m, --method METHOD    压缩算法
  -l, --level LEVEL      fast, balanced 或 best
  -o, --output OUT       输出文件
  -b, --buffer-size N    块大小（字节）
  -f, --force            覆盖已存在的输出文件
  -p, --progress         在终端上显示进度

支持的格式: )EOF", arg0);

    print_formats(reg, stderr);

    fprintf(stderr, "\n\n");
    exit(code);
}

static const struct option long_opts[] = {
    { "method",      required_argument, nullptr, 'm' },
    { "level",       required_argument, nullptr, 'l' },
    { "output",      required_argument, nullptr, 'o' },
    { "buffer-size", required_argument, nullptr, 'b' },
    { "force",       no_argument,       nullptr, 'f' },
    { "progress",    no_argument,       nullptr, 'p' },
    { "help",        no_argument,       nullptr, 'h' },
    { nullptr, 0, nullptr, 0 },
};

// 解析块大小，失败返回0
static size_t parse_size(const char *s) {
    char *end;
    errno = 0;
    unsigned long long v = strtoull(s, &end, 10);
    if (errno || end == s || *end != '\0' || *s == '-')
        return 0;
    return v > MAX_BUFFER_SIZE ? MAX_BUFFER_SIZE + 1 : v;
}

// 主函数
int main(int argc, char *argv[]) {
    cmdline_logging();

    registry reg = default_registry();

    if (argc < 2)
        usage(argv[0], reg);

    // 为了向后兼容，跳过'--'
    string_view action(argv[1]);
    if (str_starts(action, "--"))
        action = argv[1] + 2;

    if (action == "help") {
        usage(argv[0], reg, 0);
    } else if (action == "formats") {
        print_formats(reg, stdout);
        printf("\n");
        return 0;
    }

    bool compress = action == "compress" || action == "c";
    if (!compress && action != "decompress" && action != "x")
        usage(argv[0], reg);

    const char *method = nullptr;
    const char *level = nullptr;
    const char *outfile = nullptr;
    size_t buffer_size = 0;
    bool force = false;
    bool progress = false;

    // 跳过操作名
    char *arg0 = argv[0];
    --argc;
    ++argv;
    int c;
    while ((c = getopt_long(argc, argv, "m:l:o:b:fph", long_opts, nullptr)) != -1) {
        switch (c) {
        case 'm':
            method = optarg;
            break;
        case 'l':
            level = optarg;
            break;
        case 'o':
            outfile = optarg;
            break;
        case 'b':
            buffer_size = parse_size(optarg);
            if (buffer_size == 0)
                LOGE("Invalid buffer size: %s\n", optarg);
            break;
        case 'f':
            force = true;
            break;
        case 'p':
            progress = true;
            break;
        case 'h':
            usage(arg0, reg, 0);
            break;
        default:
            usage(arg0, reg);
        }
    }
    if (optind != argc - 1)
        usage(arg0, reg);

    string_view infile(argv[optind]);
    input_source input;
    if (infile == "-")
        input = stdin_tag{};
    else
        input = file_path{ string(infile) };

    optional<output_destination> output;
    if (outfile) {
        if (outfile == "-"sv)
            output = stdout_tag{};
        else
            output = file_path{ outfile };
    } else if (holds_alternative<stdin_tag>(input) && !isatty(STDOUT_FILENO)) {
        output = stdout_tag{};
    }

    fs_handler files;
    cmd_context ctx{ reg, files, isatty(STDERR_FILENO) != 0 };

    failure f;
    if (compress) {
        compress_opts opts;
        opts.input = input;
        if (method)
            opts.algorithm = method;
        if (level && !name2level(level, opts.level))
            LOGE("Unknown compression level: [%s]\n", level);
        opts.output = output;
        opts.buffer_size = buffer_size;
        opts.force = force;
        opts.progress = progress;
        f = run_compress(opts, ctx);
    } else {
        if (level)
            usage(arg0, reg);
        decompress_opts opts;
        opts.input = input;
        if (method)
            opts.algorithm = method;
        opts.output = output;
        opts.buffer_size = buffer_size;
        opts.force = force;
        opts.progress = progress;
        f = run_decompress(opts, ctx);
    }

    if (f) {
        LOGE("%s\n", f.message().data());
        return 1;
    }
    return 0;
}
