#include <gtest/gtest.h>

#include "core/csr_utils.h"
#include "fpu/fp_flags.h"

namespace rvfpu {

TEST(CsrUtilsTest, WriteFflagsKeepsFcsrAliasConsistent) {
    csr::CsrFile csr_file{};
    csr_file.fill(0);
    csr_file[csr::kFcsr] = 0xA0;

    csr::write(csr_file, csr::kFflags, 0x3A);

    EXPECT_EQ(csr_file[csr::kFflags], 0x1A);
    EXPECT_EQ(csr_file[csr::kFcsr], 0xBA);
    EXPECT_EQ(csr::read(csr_file, csr::kFflags), 0x1A);
}

TEST(CsrUtilsTest, WriteFrmKeepsFcsrAliasConsistent) {
    csr::CsrFile csr_file{};
    csr_file.fill(0);
    csr_file[csr::kFcsr] = 0x1F;

    csr::write(csr_file, csr::kFrm, 0xF);

    EXPECT_EQ(csr_file[csr::kFrm], 0x7);
    EXPECT_EQ(csr_file[csr::kFcsr], 0xFF);
    EXPECT_EQ(csr::read(csr_file, csr::kFrm), 0x7);
}

TEST(CsrUtilsTest, WriteFcsrUpdatesFflagsAndFrmViews) {
    csr::CsrFile csr_file{};
    csr_file.fill(0);

    csr::write(csr_file, csr::kFcsr, 0xAB);

    EXPECT_EQ(csr_file[csr::kFcsr], 0xAB);
    EXPECT_EQ(csr_file[csr::kFflags], 0x0B);
    EXPECT_EQ(csr_file[csr::kFrm], 0x5);
    EXPECT_EQ(csr::read(csr_file, csr::kFflags), 0x0B);
    EXPECT_EQ(csr::read(csr_file, csr::kFrm), 0x5);
}

TEST(CsrUtilsTest, AccumulateFflagsIsSticky) {
    csr::CsrFile csr_file{};
    csr_file.fill(0);
    csr::write(csr_file, csr::kFrm, 0x3);

    csr::accumulateFflags(csr_file, FpFlags::NX);
    csr::accumulateFflags(csr_file, FpFlags::DZ);
    csr::accumulateFflags(csr_file, 0);

    EXPECT_EQ(csr::read(csr_file, csr::kFflags), FpFlags::NX | FpFlags::DZ) << "标志只置位不清除";
    EXPECT_EQ(csr::read(csr_file, csr::kFrm), 0x3) << "累积标志不影响 frm";
    EXPECT_EQ(csr::read(csr_file, csr::kFcsr), 0x69);
}

TEST(CsrUtilsTest, NonFloatingPointAddressIgnored) {
    csr::CsrFile csr_file{};
    csr_file.fill(0);
    EXPECT_FALSE(csr::isFloatingPointCsr(0x300));
    EXPECT_TRUE(csr::isFloatingPointCsr(csr::kFcsr));
    csr::write(csr_file, 0x300, 0xFF);
    EXPECT_EQ(csr::read(csr_file, 0x300), 0u);
    EXPECT_EQ(csr::read(csr_file, csr::kFcsr), 0u);
}

}  // namespace rvfpu
