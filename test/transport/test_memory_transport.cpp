#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "async_modbus/transport/memory_transport.hpp"

using asyncmb::MemoryTransport;

TEST(MemoryTransport, DefaultConstruction) {
  MemoryTransport transport;

  EXPECT_TRUE(transport.IsOpen());
  EXPECT_FALSE(transport.HasData());
  EXPECT_EQ(transport.AvailableBytes(), 0);
  EXPECT_EQ(transport.GetWrittenData().size(), 0);
}

TEST(MemoryTransport, ReadPartialData) {
  MemoryTransport transport;
  std::vector<uint8_t> test_data{0x01, 0x02, 0x03, 0x04, 0x05};
  transport.SetReadData(test_data);

  uint8_t buffer[3] = {0};
  int bytes_read = transport.Read(buffer);

  EXPECT_EQ(bytes_read, 3);
  EXPECT_EQ(buffer[0], 0x01);
  EXPECT_EQ(buffer[2], 0x03);
  EXPECT_TRUE(transport.HasData());
  EXPECT_EQ(transport.AvailableBytes(), 2);

  bytes_read = transport.Read(buffer);
  EXPECT_EQ(bytes_read, 2);
  EXPECT_EQ(buffer[0], 0x04);
  EXPECT_EQ(buffer[1], 0x05);
  EXPECT_FALSE(transport.HasData());
}

TEST(MemoryTransport, ReadWithNoDataReturnsZero) {
  MemoryTransport transport;
  uint8_t buffer[4] = {0};
  EXPECT_EQ(transport.Read(buffer), 0);
}

TEST(MemoryTransport, AppendQueuesBehindUnreadData) {
  MemoryTransport transport;
  std::vector<uint8_t> first{0x01, 0x02};
  std::vector<uint8_t> second{0x03};
  transport.SetReadData(first);

  uint8_t buffer[1] = {0};
  EXPECT_EQ(transport.Read(buffer), 1);
  transport.AppendReadData(second);
  EXPECT_EQ(transport.AvailableBytes(), 2);

  uint8_t rest[4] = {0};
  EXPECT_EQ(transport.Read(rest), 2);
  EXPECT_EQ(rest[0], 0x02);
  EXPECT_EQ(rest[1], 0x03);
}

TEST(MemoryTransport, SetReadDataReplacesBuffer) {
  MemoryTransport transport;
  std::vector<uint8_t> first{0x01, 0x02};
  std::vector<uint8_t> second{0x09};
  transport.SetReadData(first);
  transport.SetReadData(second);

  uint8_t buffer[4] = {0};
  EXPECT_EQ(transport.Read(buffer), 1);
  EXPECT_EQ(buffer[0], 0x09);
}

TEST(MemoryTransport, WriteIsCaptured) {
  MemoryTransport transport;
  std::vector<uint8_t> first{0xAA, 0xBB};
  std::vector<uint8_t> second{0xCC};

  EXPECT_EQ(transport.Write(first), 2);
  EXPECT_EQ(transport.Write(second), 1);
  EXPECT_TRUE(transport.Flush());

  auto written = transport.GetWrittenData();
  ASSERT_EQ(written.size(), 3);
  EXPECT_EQ(written[0], 0xAA);
  EXPECT_EQ(written[2], 0xCC);

  transport.ClearWriteBuffer();
  EXPECT_EQ(transport.GetWrittenData().size(), 0);
}

TEST(MemoryTransport, ClosedTransportFailsIo) {
  MemoryTransport transport;
  std::vector<uint8_t> data{0x01};
  transport.SetReadData(data);
  transport.Close();

  uint8_t buffer[1] = {0};
  EXPECT_FALSE(transport.IsOpen());
  EXPECT_FALSE(transport.HasData());
  EXPECT_EQ(transport.Read(buffer), -1);
  EXPECT_EQ(transport.Write(data), -1);
  EXPECT_FALSE(transport.Flush());

  transport.Reopen();
  EXPECT_TRUE(transport.IsOpen());
  EXPECT_EQ(transport.Read(buffer), 1);
}
