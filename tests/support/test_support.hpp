#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/dump/dump_reader.hpp"
#include "internal/ingest/disk_space.hpp"
#include "internal/ingest/progress.hpp"

namespace bibmirror::testing {

/*
  Dump fixtures in the layout of the upstream MySQL exports.
*/

inline std::string NonFictionTable() {
  return "CREATE TABLE `updated` (\n"
         "  `ID` int(15) unsigned NOT NULL AUTO_INCREMENT,\n"
         "  `Title` varchar(2000) DEFAULT '',\n"
         "  `Series` varchar(300) DEFAULT '',\n"
         "  `Author` varchar(1000) DEFAULT '',\n"
         "  `Year` varchar(14) DEFAULT '',\n"
         "  `Edition` varchar(60) DEFAULT '',\n"
         "  `Publisher` varchar(400) DEFAULT '',\n"
         "  `Pages` varchar(100) DEFAULT '',\n"
         "  `Language` varchar(150) DEFAULT '',\n"
         "  `Identifier` varchar(300) DEFAULT '',\n"
         "  `Filesize` bigint(20) unsigned NOT NULL DEFAULT '0',\n"
         "  `Extension` varchar(50) DEFAULT '',\n"
         "  `MD5` char(32) DEFAULT NULL,\n"
         "  `Coverurl` varchar(200) DEFAULT '',\n"
         "  `TimeAdded` timestamp NOT NULL DEFAULT '2000-01-01 05:00:00',\n"
         "  `TimeLastModified` timestamp NOT NULL DEFAULT CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP,\n"
         "  PRIMARY KEY (`ID`),\n"
         "  UNIQUE KEY `MD5` (`MD5`)\n"
         ") ENGINE=MyISAM DEFAULT CHARSET=utf8;\n";
}

inline std::string NonFictionTuple(uint64_t id, const std::string& title, const std::string& modified) {
  return "(" + std::to_string(id) + ",'" + title + "','','Some Author','2001','2nd','Publisher','320','English','isbn" +
         std::to_string(id) + "'," + std::to_string(1000 + id) + ",'pdf','md5-" + std::to_string(id) +
         "','covers/" + std::to_string(id) + ".jpg','2000-01-01 00:00:00','" + modified + "')";
}

inline std::string FictionTable() {
  return "CREATE TABLE `fiction` (\n"
         "  `ID` int(10) unsigned NOT NULL AUTO_INCREMENT,\n"
         "  `MD5` char(32) CHARACTER SET ascii DEFAULT NULL,\n"
         "  `Title` varchar(2000) DEFAULT '',\n"
         "  `Author` varchar(300) DEFAULT '',\n"
         "  `Series` varchar(300) DEFAULT '',\n"
         "  `Edition` varchar(50) DEFAULT '',\n"
         "  `Language` varchar(45) DEFAULT '',\n"
         "  `Year` varchar(10) DEFAULT '',\n"
         "  `Publisher` varchar(100) DEFAULT '',\n"
         "  `Pages` varchar(10) DEFAULT '',\n"
         "  `Identifier` varchar(400) DEFAULT '',\n"
         "  `Extension` varchar(10) DEFAULT '',\n"
         "  `Filesize` bigint(20) unsigned DEFAULT NULL,\n"
         "  `Coverurl` varchar(200) DEFAULT '',\n"
         "  `TimeAdded` timestamp NOT NULL DEFAULT CURRENT_TIMESTAMP,\n"
         "  `TimeLastModified` timestamp NOT NULL DEFAULT CURRENT_TIMESTAMP,\n"
         "  PRIMARY KEY (`ID`)\n"
         ") ENGINE=MyISAM DEFAULT CHARSET=utf8;\n";
}

inline std::string FictionTuple(uint64_t id, const std::string& title, const std::string& modified) {
  return "(" + std::to_string(id) + ",'md5-" + std::to_string(id) + "','" + title +
         "','Writer','Saga','1st','Russian','1999','House','250',NULL,'epub'," + std::to_string(2000 + id) +
         ",'','2010-05-05 10:00:00','" + modified + "')";
}

inline std::string SciMagTable() {
  return "CREATE TABLE `scimag` (\n"
         "  `ID` int(15) unsigned NOT NULL AUTO_INCREMENT,\n"
         "  `DOI` varchar(200) NOT NULL,\n"
         "  `Title` varchar(2000) DEFAULT NULL,\n"
         "  `Author` varchar(2000) DEFAULT NULL,\n"
         "  `Year` varchar(10) DEFAULT NULL,\n"
         "  `Volume` varchar(45) DEFAULT NULL,\n"
         "  `Issue` varchar(95) DEFAULT NULL,\n"
         "  `First_page` varchar(45) DEFAULT NULL,\n"
         "  `Last_page` varchar(45) DEFAULT NULL,\n"
         "  `Journal` varchar(500) DEFAULT NULL,\n"
         "  `ISSNP` varchar(9) DEFAULT NULL,\n"
         "  `Filesize` bigint(20) unsigned NOT NULL DEFAULT '0',\n"
         "  `MD5` char(32) DEFAULT NULL,\n"
         "  `TimeAdded` timestamp NOT NULL DEFAULT CURRENT_TIMESTAMP,\n"
         "  PRIMARY KEY (`ID`),\n"
         "  UNIQUE KEY `DOIUNIQUE` (`DOI`)\n"
         ") ENGINE=MyISAM DEFAULT CHARSET=utf8;\n";
}

inline std::string SciMagTuple(uint64_t id, const std::string& doi, const std::string& added) {
  return "(" + std::to_string(id) + ",'" + doi + "','Article " + std::to_string(id) +
         "','A. Researcher','2015','12','3','101','110','Journal of Tests','1234-5678'," + std::to_string(300 + id) +
         ",'md5-" + std::to_string(id) + "','" + added + "')";
}

inline std::string InsertLine(const std::string& table, const std::vector<std::string>& tuples) {
  std::string line = "INSERT INTO `" + table + "` VALUES ";
  for (size_t i = 0; i < tuples.size(); ++i) {
    if (i > 0) line += ",";
    line += tuples[i];
  }
  return line + ";\n";
}

inline std::string DumpPreamble() {
  return "-- MySQL dump 10.13  Distrib 5.7.33\n"
         "/*!40101 SET NAMES utf8 */;\n"
         "DROP TABLE IF EXISTS `updated`;\n";
}

inline std::unique_ptr<dump::DumpReader> ReaderFor(const std::string& text) {
  return std::make_unique<dump::DumpReader>(std::make_unique<std::istringstream>(text), text.size());
}

/*
  Disk probe replaying scripted readings; the last one repeats.
*/
class ScriptedDiskSpaceProbe final : public ingest::DiskSpaceProbe {
 public:
  explicit ScriptedDiskSpaceProbe(std::vector<std::optional<uint64_t>> readings) : readings_(readings.begin(), readings.end()) {
  }

  std::optional<uint64_t> FreeBytes() override {
    std::scoped_lock lock(mutex_);
    ++calls_;
    if (readings_.size() > 1) {
      auto reading = readings_.front();
      readings_.pop_front();
      return reading;
    }
    return readings_.empty() ? std::nullopt : readings_.front();
  }

  uint64_t Calls() const {
    return calls_;
  }

 private:
  std::mutex                           mutex_;
  std::deque<std::optional<uint64_t>>  readings_;
  uint64_t                             calls_ = 0;
};

class RecordingProgressSink final : public ingest::ProgressSink {
 public:
  void OnProgress(const ingest::ProgressEvent& event) override {
    events.push_back(event);
  }

  template <typename Event>
  std::vector<Event> Of() const {
    std::vector<Event> out;
    for (const auto& e : events) {
      if (const auto* typed = std::get_if<Event>(&e)) out.push_back(*typed);
    }
    return out;
  }

  std::vector<ingest::ProgressEvent> events;
};

} // namespace bibmirror::testing
