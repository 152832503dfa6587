#include "readeof/filecursor.hpp"
#include "test_common.hpp"

#include <array>
#include <string>
#include <utility>

#include <sys/stat.h>

using reof::ErrorKind;
using reof::FileCursor;

int main() {
    try {
        TempDir tmp("cursor");
        const std::string path = tmp.file("data.txt");
        write_file(path, "0123456789");

        // 1) open, size, positional reads
        FileCursor f = FileCursor::open(path);
        ASSERT_TRUE(f.is_open());
        ASSERT_EQ(f.size(), 10u);

        std::array<std::byte, 4> buf{};
        ASSERT_EQ(f.read_at(buf, 3), 4u);
        ASSERT_TRUE(buf[0] == std::byte{'3'} && buf[3] == std::byte{'6'});
        ASSERT_EQ(f.read_at(buf, 8), 2u);   // short read at EOF
        ASSERT_EQ(f.read_at(buf, 10), 0u);

        // 2) stat refreshes the size after growth
        append_file(path, "abc");
        ASSERT_EQ(f.stat(), 13u);
        ASSERT_EQ(f.size(), 13u);

        // 3) read_exact past EOF is an IOError
        bool threw = false;
        try {
            f.read_exact(buf, 11);
        } catch (const reof::TailError& e) {
            threw = (e.kind == ErrorKind::IOError);
        }
        ASSERT_TRUE(threw);

        // 4) moves transfer ownership
        FileCursor g = std::move(f);
        ASSERT_TRUE(!f.is_open());
        ASSERT_TRUE(g.is_open());
        ASSERT_EQ(g.path(), path);
        g.close();
        ASSERT_TRUE(!g.is_open());
        ASSERT_TRUE(!g.try_stat().has_value());

        // 5) try_open reports the classified error
        auto missing = FileCursor::try_open(tmp.file("nope.txt"));
        ASSERT_TRUE(!missing.has_value());
        ASSERT_TRUE(missing.error().kind == ErrorKind::NotFound);
        ASSERT_TRUE(missing.error().code != 0);

        auto dir = FileCursor::try_open(tmp.path().string());
        ASSERT_TRUE(!dir.has_value());
        ASSERT_TRUE(dir.error().kind == ErrorKind::IsADirectory);

        auto empty = FileCursor::try_open("");
        ASSERT_TRUE(!empty.has_value());
        ASSERT_TRUE(empty.error().kind == ErrorKind::InvalidArgument);

        // a FIFO is rejected without blocking in open()
        const std::string fifo = tmp.file("pipe");
        if (::mkfifo(fifo.c_str(), 0600) == 0) {
            auto p = FileCursor::try_open(fifo);
            ASSERT_TRUE(!p.has_value());
            ASSERT_TRUE(p.error().kind == ErrorKind::IsADirectory);
        }

        // 6) replacement detection
        FileCursor h = FileCursor::open(path);
        ASSERT_TRUE(!h.replaced_on_disk());
        const std::string fresh = tmp.file("fresh.txt");
        write_file(fresh, "new");
        fs::rename(fresh, path);
        ASSERT_TRUE(h.replaced_on_disk());
        fs::remove(path);
        ASSERT_TRUE(!h.replaced_on_disk());  // path gone: keep the old handle

        ASSERT_EQ(reof::to_string(ErrorKind::PermissionDenied), std::string_view("permission denied"));

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All file cursor tests passed" << std::endl;
    return 0;
}
