#include "infrastructure/staged_file.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <sstream>

namespace netprov
{
    namespace infrastructure
    {

        std::optional<std::string> read_text_file(const std::filesystem::path &path)
        {
            std::ifstream stream(path);
            if (!stream)
            {
                return std::nullopt;
            }
            std::ostringstream content;
            content << stream.rdbuf();
            return content.str();
        }

        StagedConfigFile::StagedConfigFile(const std::filesystem::path &staging_dir,
                                           const std::filesystem::path &live_path)
            : live_path_(live_path),
              staged_path_(staging_dir / (live_path.filename().string() + ".new")),
              backup_path_(staging_dir / (live_path.filename().string() + ".bak")),
              logger_(core::get_logger("StagedConfigFile"))
        {
        }

        bool StagedConfigFile::stage(const std::string &content)
        {
            try
            {
                std::filesystem::create_directories(staged_path_.parent_path());

                std::ofstream stream(staged_path_, std::ios::trunc);
                if (!stream)
                {
                    logger_->error("Cannot create staged config file",
                                   core::LogContext().add("file", staged_path_.string()));
                    return false;
                }
                stream << content;
                stream.close();
                if (!stream)
                {
                    logger_->error("Short write on staged config file",
                                   core::LogContext().add("file", staged_path_.string()));
                    return false;
                }

                logger_->debug("Config staged", core::LogContext().add("file", staged_path_.string()));
                return true;
            }
            catch (const std::exception &e)
            {
                logger_->error("Error staging config file", core::LogContext().add("error", e.what()));
                return false;
            }
        }

        bool StagedConfigFile::replace_atomically(const std::filesystem::path &source)
        {
            // Staging and /etc usually live on different filesystems, so copy
            // next to the target first and rename within its directory.
            auto temp = live_path_;
            temp += ".netprov-tmp";

            std::error_code ec;
            std::filesystem::create_directories(live_path_.parent_path(), ec);
            std::filesystem::copy_file(source, temp, std::filesystem::copy_options::overwrite_existing, ec);
            if (ec)
            {
                logger_->error("Cannot copy config into place",
                               core::LogContext().add("file", live_path_.string()).add("error", ec.message()));
                return false;
            }
            std::filesystem::rename(temp, live_path_, ec);
            if (ec)
            {
                std::filesystem::remove(temp, ec);
                logger_->error("Cannot rename config into place",
                               core::LogContext().add("file", live_path_.string()));
                return false;
            }
            return true;
        }

        bool StagedConfigFile::install()
        {
            std::error_code ec;
            had_live_ = std::filesystem::exists(live_path_, ec);
            if (had_live_)
            {
                std::filesystem::copy_file(live_path_, backup_path_,
                                           std::filesystem::copy_options::overwrite_existing, ec);
                if (ec)
                {
                    logger_->error("Cannot back up live config",
                                   core::LogContext().add("file", live_path_.string()).add("error", ec.message()));
                    return false;
                }
            }

            if (!replace_atomically(staged_path_))
            {
                return false;
            }

            logger_->debug("Config installed",
                           core::LogContext().add("file", live_path_.string()).add("replaced", had_live_));
            return true;
        }

        bool StagedConfigFile::remove_live()
        {
            std::error_code ec;
            had_live_ = std::filesystem::exists(live_path_, ec);
            if (!had_live_)
            {
                return true;
            }

            std::filesystem::create_directories(backup_path_.parent_path(), ec);
            std::filesystem::copy_file(live_path_, backup_path_,
                                       std::filesystem::copy_options::overwrite_existing, ec);
            if (ec)
            {
                logger_->error("Cannot back up config before removal",
                               core::LogContext().add("file", live_path_.string()).add("error", ec.message()));
                return false;
            }

            std::filesystem::remove(live_path_, ec);
            if (ec)
            {
                logger_->error("Cannot remove config",
                               core::LogContext().add("file", live_path_.string()).add("error", ec.message()));
                return false;
            }
            return true;
        }

        bool StagedConfigFile::restore()
        {
            std::error_code ec;
            if (had_live_)
            {
                if (!replace_atomically(backup_path_))
                {
                    return false;
                }
                logger_->debug("Previous config restored", core::LogContext().add("file", live_path_.string()));
                return true;
            }

            std::filesystem::remove(live_path_, ec);
            if (ec)
            {
                logger_->error("Cannot remove installed config",
                               core::LogContext().add("file", live_path_.string()).add("error", ec.message()));
                return false;
            }
            return true;
        }

        void StagedConfigFile::discard()
        {
            std::error_code ec;
            std::filesystem::remove(staged_path_, ec);
            std::filesystem::remove(backup_path_, ec);
        }

        bool StagedConfigFile::live_exists() const
        {
            std::error_code ec;
            return std::filesystem::exists(live_path_, ec);
        }

        std::optional<std::string> StagedConfigFile::read_live() const
        {
            return read_text_file(live_path_);
        }

    } // namespace infrastructure
} // namespace netprov
