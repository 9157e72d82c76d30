#include "imgsniff/reader.hpp"

#include "imgsniff/exception.hpp"

using namespace imgsniff;



class reader::impl {
  public:
    FILE* fptr;



    explicit impl(FILE* f) : fptr{f} {}

    impl(const impl&) = delete;
    impl(impl&&)      = delete;

    impl& operator=(const impl&) = delete;
    impl& operator=(impl&&) = delete;

    ~impl() {
      if (fptr != nullptr) {
        fclose(fptr); //NOLINT(*-owning-memory)
      }
    }
};





reader::reader(reader&&) noexcept = default;

reader& reader::operator=(reader&&) noexcept = default;

reader::~reader() = default;



reader::reader(const std::filesystem::path& p) :
  //NOLINTNEXTLINE(*-owning-memory)
  impl_{std::make_unique<impl>(fopen(p.c_str(), "rb"))}
{
  if (impl_->fptr == nullptr) {
    throw no_stream_access{p.string()};
  }
}





size_t reader::read(std::span<std::byte> buffer) {
  if (impl_ && impl_->fptr != nullptr) {
    return fread(buffer.data(), sizeof(std::byte), buffer.size(), impl_->fptr);
  }
  return 0;
}
