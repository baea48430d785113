#pragma once

/**
 * @brief Removes recursively file/directory @p path
 * @details Symbolic links are not followed
 *
 * @return 0 on success, -1 on error (errno is set appropriately)
 */
int remove_r(const char* path) noexcept;
