#ifndef IMGSNIFF_TESTS_COMMON_HPP_INCLUDED
#define IMGSNIFF_TESTS_COMMON_HPP_INCLUDED

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <source_location>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>



inline std::ostream& operator<<(std::ostream& out, const std::source_location& loc) {
  return out << loc.file_name() << ":" << loc.line() << ":" << loc.column() << ":"
    << " in `" << loc.function_name() << "`";
}



inline std::ostream& operator<<(
    std::ostream&                     out,
    const std::optional<std::string>& value
) {
  if (value) {
    return out << '"' << *value << '"';
  }
  return out << "<absent>";
}



inline std::ostream& operator<<(std::ostream& out, std::span<const std::byte> list) {
  std::stringstream buffer;
  for (auto b: list) {
    buffer << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(b)
      << ' ';
  }
  return out << buffer.str();
}





inline void id_assert(
  bool                       v,
  std::string_view           err_msg  = {},
  const std::source_location location = std::source_location::current()
) {
  if (!v) {
    std::cout << location << " id_assert failed";

    if (!err_msg.empty()) {
      std::cout << ":\n  " << err_msg;
    }

    std::cout << '\n' << std::flush;

    std::exit(1);
  }
}





template<typename T>
concept can_be_written_to_ostream = requires(const T& a, std::ostream& out) {
  { out << a } -> std::same_as<std::ostream&>;
};



template<typename T, typename U>
void id_assert_eq(
  T v1, U v2,
  std::string_view           err_msg  = {},
  const std::source_location location = std::source_location::current()
) {
  if (!(v1 == v2)) {
    if constexpr (can_be_written_to_ostream<T> && can_be_written_to_ostream<U>) {
      std::cout << location << " id_assert_eq failed !(" << v1 << " == " << v2 << ")";
    } else {
      std::cout << location << " id_assert_eq failed";
    }

    if (!err_msg.empty()) {
      std::cout << ":\n  " << err_msg;
    }

    std::cout << '\n' << std::flush;

    std::exit(1);
  }
}





[[nodiscard]] inline std::vector<std::byte> bytes(std::string_view str) {
  auto view = std::as_bytes(std::span{str});
  return {view.begin(), view.end()};
}



[[nodiscard]] inline std::vector<std::byte> bytes(std::initializer_list<unsigned char> list) {
  std::vector<std::byte> out;
  out.reserve(list.size());
  for (auto b: list) {
    out.push_back(std::byte{b});
  }
  return out;
}



// File in the temporary directory, removed again on destruction.
class temp_file {
  public:
    temp_file(const temp_file&) = delete;
    temp_file(temp_file&&)      = delete;
    temp_file& operator=(const temp_file&) = delete;
    temp_file& operator=(temp_file&&)      = delete;

    explicit temp_file(std::string_view name, std::span<const std::byte> content) :
      path_{std::filesystem::temp_directory_path() / name}
    {
      std::ofstream out{path_, std::ios::binary | std::ios::trunc};
      //NOLINTNEXTLINE(*reinterpret-cast)
      out.write(reinterpret_cast<const char*>(content.data()),
                static_cast<std::streamsize>(content.size()));
      id_assert(out.good(), "unable to write temporary file");
    }

    ~temp_file() {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }



    [[nodiscard]] const std::filesystem::path& path() const { return path_; }



  private:
    std::filesystem::path path_;
};


#endif // IMGSNIFF_TESTS_COMMON_HPP_INCLUDED
