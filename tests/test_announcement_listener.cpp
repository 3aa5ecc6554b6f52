#include <gtest/gtest.h>

#include "discovery/AnnouncementListener.hpp"
#include "discovery/AvahiBrowser.hpp"

using namespace fleet_ops::discovery;

namespace
{
    ServiceAnnouncement Announcement(const std::string &instance, const std::string &ip, int port = 5000)
    {
        ServiceAnnouncement announcement;
        announcement.instance_name = instance;
        announcement.host_name = instance + ".local";
        announcement.addresses = {ip};
        announcement.port = port;
        return announcement;
    }
}

TEST(AnnouncementDecodeTest, TxtRecordSuppliesIdentity)
{
    ServiceAnnouncement announcement = Announcement("Kitchen Pi", "192.168.1.40");
    announcement.txt = {{"device_id", "pi-01"}, {"service", "Kitchen Recorder"}, {"version", "1.4.2"}};

    AnnouncedDevice device = DecodeAnnouncement(announcement);

    EXPECT_EQ(device.record.device_id, "pi-01");
    EXPECT_EQ(device.record.display_name, "Kitchen Recorder");
    EXPECT_EQ(device.record.ip, "192.168.1.40");
    EXPECT_EQ(device.record.port, 5000);
    EXPECT_EQ(device.record.BaseUrl(), "http://192.168.1.40:5000");
    EXPECT_EQ(device.service, "Kitchen Recorder");
    EXPECT_EQ(device.version, "1.4.2");
}

TEST(AnnouncementDecodeTest, InstanceNameIsTheFallback)
{
    AnnouncedDevice device = DecodeAnnouncement(Announcement("garage-cam", "192.168.1.41", 5001));

    EXPECT_EQ(device.record.device_id, "garage-cam");
    EXPECT_EQ(device.record.display_name, "garage-cam");
    EXPECT_EQ(device.record.port, 5001);

    ServiceAnnouncement unnamed = Announcement("Porch Pi", "192.168.1.44");
    unnamed.txt = {{"device_id", "pi-05"}, {"name", "ignored"}};
    EXPECT_EQ(DecodeAnnouncement(unnamed).record.display_name, "Porch Pi");
}

TEST(AnnouncementDecodeTest, SkipsIPv6ForFirstIPv4)
{
    ServiceAnnouncement announcement = Announcement("pi-02", "fe80::1");
    announcement.addresses.push_back("192.168.1.42");

    EXPECT_EQ(DecodeAnnouncement(announcement).record.ip, "192.168.1.42");
}

TEST(AnnouncementDecodeTest, RejectsUnusableRecords)
{
    ServiceAnnouncement empty_id = Announcement("pi-03", "192.168.1.43");
    empty_id.txt["device_id"] = "";
    EXPECT_THROW(DecodeAnnouncement(empty_id), AnnouncementDecodeError);

    EXPECT_THROW(DecodeAnnouncement(Announcement("pi-04", "fe80::2")), AnnouncementDecodeError);
    EXPECT_THROW(DecodeAnnouncement(Announcement("pi-05", "192.168.1.45", 0)), AnnouncementDecodeError);
    EXPECT_THROW(DecodeAnnouncement(Announcement("", "192.168.1.46")), AnnouncementDecodeError);
}

TEST(AnnouncementListenerTest, MalformedRecordIsSkippedOthersKept)
{
    AnnouncementListener listener;

    EXPECT_TRUE(listener.OnServiceAdded(Announcement("pi-01", "192.168.1.40")));
    EXPECT_FALSE(listener.OnServiceAdded(Announcement("broken", "not-an-address")));
    EXPECT_TRUE(listener.OnServiceAdded(Announcement("pi-02", "192.168.1.42")));

    auto snapshot = listener.Snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].device_id, "pi-01");
    EXPECT_EQ(snapshot[1].device_id, "pi-02");
    EXPECT_EQ(listener.DecodeFailures(), 1u);
}

TEST(AnnouncementListenerTest, ReannouncementReplacesAddress)
{
    AnnouncementListener listener;
    listener.OnServiceAdded(Announcement("pi-01", "192.168.1.40"));
    listener.OnServiceAdded(Announcement("pi-01", "192.168.1.77"));

    auto snapshot = listener.Snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].ip, "192.168.1.77");
}

TEST(AnnouncementListenerTest, RemovalOnlyAffectsPresence)
{
    AnnouncementListener listener;
    listener.OnServiceAdded(Announcement("pi-01", "192.168.1.40"));
    listener.OnServiceAdded(Announcement("pi-02", "192.168.1.42"));

    listener.OnServiceRemoved("pi-01");
    listener.OnServiceRemoved("never-seen");

    auto devices = listener.Devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].instance_name, "pi-02");
}

TEST(AvahiBrowserTest, NormalizesServiceType)
{
    EXPECT_EQ(AvahiBrowser::NormalizeServiceType("_ewego._tcp.local."), "_ewego._tcp");
    EXPECT_EQ(AvahiBrowser::NormalizeServiceType("_ewego._tcp."), "_ewego._tcp");
    EXPECT_EQ(AvahiBrowser::NormalizeServiceType("_ewego._tcp"), "_ewego._tcp");
}
