#include "slabrc/slabrc.hpp"

#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

namespace {

// Announces its own destruction so the single release is visible.
class NoisyValue {
 public:
  explicit NoisyValue(int value) : value_(value) {}
  NoisyValue(NoisyValue&& other) : value_(other.value_) { other.value_ = -1; }
  ~NoisyValue() {
    if (value_ >= 0) std::printf("destroy NoisyValue %d\n", value_);
  }

  int value() const { return value_; }

 private:
  NoisyValue(const NoisyValue&);
  NoisyValue& operator=(const NoisyValue&);

  int value_;
};

typedef std::vector<NoisyValue> NoisyList;

void Print(const char* name, const slabrc::memory::WeightedHandle<NoisyList>& handle) {
  std::ostringstream values;
  for (std::size_t i = 0; i < handle->size(); ++i) {
    values << (i == 0 ? "" : ", ") << (*handle)[i].value();
  }
  std::printf("%s: slab#%llu slot %zu weight 2^%u [%s]\n", name,
              static_cast<unsigned long long>(handle.slab_id()), handle.slot_index(),
              static_cast<unsigned int>(handle.weight_exponent()), values.str().c_str());
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string log_config = argc > 1 ? argv[1] : std::string();
  const std::string slab_config = argc > 2 ? argv[2] : std::string();

  slabrc::api::Status st = slabrc::log::LogManager::Init(argv[0], log_config);
  if (!st.ok()) {
    std::fprintf(stderr, "log init failed: %s (%s)\n", st.message().c_str(),
                 st.hex_code_string().c_str());
    return 1;
  }

  std::printf("slabrc %u.%u.%u\n", static_cast<unsigned int>(slabrc::api::kApiVersionMajor),
              static_cast<unsigned int>(slabrc::api::kApiVersionMinor),
              static_cast<unsigned int>(slabrc::api::kApiVersionPatch));

  slabrc::api::Result<std::unique_ptr<slabrc::memory::Slab<NoisyList> > > created =
      slab_config.empty()
          ? slabrc::memory::Slab<NoisyList>::WithCapacity(
                slabrc::memory::Slab<NoisyList>::kDefaultCapacity)
          : slabrc::memory::Slab<NoisyList>::CreateFromFile(slab_config);
  if (!created.ok()) {
    std::fprintf(stderr, "slab creation failed: %s (%s)\n", created.status().message().c_str(),
                 created.status().symbol());
    slabrc::log::LogManager::Shutdown();
    return 1;
  }
  slabrc::memory::Slab<NoisyList>& slab = *created.value();

  {
    NoisyList values;
    values.push_back(NoisyValue(1));
    values.push_back(NoisyValue(2));
    values.push_back(NoisyValue(3));

    slabrc::api::Result<slabrc::memory::WeightedHandle<NoisyList> > b =
        slab.Allocate(std::move(values));
    if (!b.ok()) {
      std::fprintf(stderr, "allocate failed: %s\n", b.status().message().c_str());
      slabrc::log::LogManager::Shutdown();
      return 1;
    }
    slabrc::api::Result<slabrc::memory::WeightedHandle<NoisyList> > c = b.value().Split();
    slabrc::api::Result<slabrc::memory::WeightedHandle<NoisyList> > d = b.value().Split();
    if (!c.ok() || !d.ok()) {
      std::fprintf(stderr, "split failed\n");
      slabrc::log::LogManager::Shutdown();
      return 1;
    }

    Print("b", b.value());
    Print("c", c.value());
    Print("d", d.value());
    slabrc::log::LogManager::Log(slabrc::log::LogSeverity::kInfo,
                                 "three handles share one slot; dropping them");
  }

  const slabrc::memory::SlabStats stats = slab.Stats();
  std::printf("in use %zu/%zu, allocations %llu, releases %llu, splits %llu\n", slab.InUse(),
              slab.Capacity(), static_cast<unsigned long long>(stats.allocations),
              static_cast<unsigned long long>(stats.releases),
              static_cast<unsigned long long>(stats.splits));

  created.value().reset();
  slabrc::log::LogManager::Shutdown();
  return 0;
}
