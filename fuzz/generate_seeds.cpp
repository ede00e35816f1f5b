// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, only a corpus generator.

#include <filesystem>
#include <fstream>
#include <string>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << data;
}

int main() {
    namespace fs = std::filesystem;
    const auto apply_dir = std::string{"fuzz/corpus/apply"};
    const auto diff_dir = std::string{"fuzz/corpus/diff"};
    fs::create_directories(apply_dir);
    fs::create_directories(diff_dir);

    // document \n patch
    write_seed(apply_dir + "/seed_add.txt",
               "{\"foo\":\"bar\"}\n[{\"op\":\"add\",\"path\":\"/baz\",\"value\":\"qux\"}]");
    write_seed(apply_dir + "/seed_move.txt",
               "{\"foo\":[\"all\",\"grass\",\"cows\",\"eat\"]}\n"
               "[{\"op\":\"move\",\"from\":\"/foo/1\",\"path\":\"/foo/3\"}]");
    write_seed(apply_dir + "/seed_test.txt",
               "{\"/\":9,\"~1\":10}\n[{\"op\":\"test\",\"path\":\"/~01\",\"value\":10}]");
    write_seed(apply_dir + "/seed_copy_remove.txt",
               "{\"a\":{\"b\":[1,2]}}\n[{\"op\":\"copy\",\"from\":\"/a\",\"path\":\"/c\"},"
               "{\"op\":\"remove\",\"path\":\"/a/b/0\"}]");

    // source \n target
    write_seed(diff_dir + "/seed_array.txt", "[1,2,3]\n[1,3,2,4]");
    write_seed(diff_dir + "/seed_object.txt", "{\"a\":1,\"b\":2}\n{\"a\":1,\"c\":3}");
    write_seed(diff_dir + "/seed_nested.txt",
               "{\"x\":[{\"id\":1},{\"id\":2}],\"a/b\":0}\n{\"x\":[{\"id\":2}],\"a/b\":[]}");

    return 0;
}
