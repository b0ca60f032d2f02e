#ifndef NETPROV_INFRASTRUCTURE_STAGED_FILE_HPP
#define NETPROV_INFRASTRUCTURE_STAGED_FILE_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace netprov
{
    namespace core
    {
        class Logger;
    }
}

namespace netprov
{
    namespace infrastructure
    {

        /**
         * Daemon configuration file written in two phases.
         *
         * stage() renders the new text into the staging directory and has no
         * effect on running daemons. install() backs up the live file (if any)
         * and atomically replaces it. restore() undoes install() or
         * remove_live(), bringing back the backup or deleting a file that did
         * not exist before.
         */
        class StagedConfigFile
        {
        public:
            StagedConfigFile(const std::filesystem::path &staging_dir, const std::filesystem::path &live_path);

            bool stage(const std::string &content);
            bool install();
            bool remove_live();
            bool restore();
            void discard();

            bool live_exists() const;
            std::optional<std::string> read_live() const;

            const std::filesystem::path &live_path() const { return live_path_; }
            const std::filesystem::path &staged_path() const { return staged_path_; }

        private:
            bool replace_atomically(const std::filesystem::path &source);

            std::filesystem::path live_path_;
            std::filesystem::path staged_path_;
            std::filesystem::path backup_path_;
            bool had_live_ = false;
            std::shared_ptr<core::Logger> logger_;
        };

        std::optional<std::string> read_text_file(const std::filesystem::path &path);

    } // namespace infrastructure
} // namespace netprov

#endif // NETPROV_INFRASTRUCTURE_STAGED_FILE_HPP
