#include "readeof/tail.hpp"
#include "test_common.hpp"

#include <string>
#include <vector>

using reof::ErrorKind;
using reof::read_last;

namespace {

// last k entries of "line 1".."line n", '\n'-joined
std::string tail_of_numbered(int n, int k) {
    std::string s;
    for (int i = n - k + 1; i <= n; ++i) {
        if (i > n - k + 1) s += '\n';
        s += "line " + std::to_string(i);
    }
    return s;
}

ErrorKind error_kind_of(const std::string& path) {
    try {
        (void)read_last(path, 5);
    } catch (const reof::TailError& e) {
        return e.kind;
    }
    return static_cast<ErrorKind>(0xFF);
}

}

int main() {
    try {
        TempDir tmp("read_last");

        // 1) basic
        const std::string basic = tmp.file("basic.txt");
        write_file(basic, "line 1\nline 2\nline 3\nline 4\nline 5");
        ASSERT_EQ(read_last(basic, 3), std::string("line 3\nline 4\nline 5"));

        // 2) examples: no trailing newline
        const std::string three = tmp.file("three.txt");
        write_file(three, "line 1\nline 2\nline 3");
        ASSERT_EQ(read_last(three, 1), std::string("line 3"));
        ASSERT_EQ(read_last(three, 2), std::string("line 2\nline 3"));
        ASSERT_EQ(read_last(three, 3), std::string("line 1\nline 2\nline 3"));
        ASSERT_EQ(read_last(three, 10), std::string("line 1\nline 2\nline 3"));

        // 3) trailing newline preserved
        const std::string trailing = tmp.file("trailing.txt");
        write_file(trailing, "line 1\nline 2\nline 3\n");
        ASSERT_EQ(read_last(trailing, 2), std::string("line 2\nline 3\n"));

        // 4) only newlines
        const std::string nl = tmp.file("newlines.txt");
        write_file(nl, "\n\n\n");
        ASSERT_EQ(read_last(nl, 2), std::string("\n\n"));

        // 5) single line
        const std::string single = tmp.file("single.txt");
        write_file(single, "single line");
        ASSERT_EQ(read_last(single, 1), std::string("single line"));

        // 6) zero / negative counts and empty files give ""
        ASSERT_EQ(read_last(basic, 0), std::string());
        ASSERT_EQ(read_last(basic, -1), std::string());
        const std::string empty = tmp.file("empty.txt");
        write_file(empty, "");
        ASSERT_EQ(read_last(empty, 5), std::string());
        ASSERT_EQ(read_last(empty, 0), std::string());

        // 7) large file with a small buffer
        const std::string large = tmp.file("large.txt");
        write_file(large, numbered_lines(1000));
        {
            reof::ReadOptions opt;
            opt.buffer_size = 64;
            ASSERT_EQ(read_last(large, 10, opt), tail_of_numbered(1000, 10));
        }

        // 8) result does not depend on the buffer size
        const std::string hundred = tmp.file("hundred.txt");
        write_file(hundred, numbered_lines(100));
        for (std::size_t bs : {1u, 64u, 1024u, 16384u, 1u << 20}) {
            reof::ReadOptions opt;
            opt.buffer_size = bs;
            ASSERT_EQ(read_last(hundred, 5, opt), tail_of_numbered(100, 5));
        }

        // 9) very long lines
        const std::string longlines = tmp.file("long.txt");
        const std::string x(10000, 'x');
        write_file(longlines, "short line\n" + x + "\nanother short line");
        ASSERT_EQ(read_last(longlines, 2), x + "\nanother short line");

        // 10) consecutive reads of the same file
        ASSERT_EQ(read_last(hundred, 10), tail_of_numbered(100, 10));
        ASSERT_EQ(read_last(hundred, 5), tail_of_numbered(100, 5));
        ASSERT_EQ(read_last(hundred, 1), tail_of_numbered(100, 1));

        // 11) UTF-8 content and CRLF pass through untouched
        const std::string utf8 = tmp.file("utf8.txt");
        write_file(utf8, "Hello \xE4\xB8\x96\xE7\x95\x8C\nBun\xC4\x83 ziua\n\xE4\xBD\xA0\xE5\xA5\xBD");
        ASSERT_EQ(read_last(utf8, 2), std::string("Bun\xC4\x83 ziua\n\xE4\xBD\xA0\xE5\xA5\xBD"));

        const std::string crlf = tmp.file("crlf.txt");
        write_file(crlf, "line 1\r\nline 2\r\nline 3\r\n");
        ASSERT_EQ(read_last(crlf, 2), std::string("line 2\r\nline 3\r\n"));

        // 12) ascii and latin1
        {
            reof::ReadOptions opt;
            opt.encoding = reof::Encoding::Ascii;
            ASSERT_EQ(read_last(three, 2, opt), std::string("line 2\nline 3"));

            const std::string latin = tmp.file("latin1.txt");
            write_file(latin, "a\ncaf\xE9");
            opt.encoding = reof::Encoding::Latin1;
            ASSERT_EQ(read_last(latin, 1, opt), std::string("caf\xC3\xA9"));
        }

        // 13) errors
        ASSERT_TRUE(error_kind_of(tmp.file("missing.txt")) == ErrorKind::NotFound);
        ASSERT_TRUE(error_kind_of(tmp.path().string()) == ErrorKind::IsADirectory);
        ASSERT_TRUE(error_kind_of("") == ErrorKind::InvalidArgument);
        ASSERT_TRUE(error_kind_of(basic + "/child") == ErrorKind::NotFound);  // ENOTDIR

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All read_last tests passed" << std::endl;
    return 0;
}
